#include <mcp_bridge/mcp/sse_parser.hpp>

#include <algorithm>
#include <cctype>

namespace mcp_bridge {

std::vector<SseEvent> SseParser::Feed(std::string_view chunk) {
    std::vector<SseEvent> events;
    buffer_.append(chunk.data(), chunk.size());

    size_t start = 0;
    for (;;) {
        auto nl = buffer_.find('\n', start);
        if (nl == std::string::npos) {
            break;
        }
        std::string_view line(buffer_.data() + start, nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        ProcessLine(line, events);
        start = nl + 1;
    }
    buffer_.erase(0, start);
    return events;
}

void SseParser::ProcessLine(std::string_view line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        if (has_data_) {
            SseEvent event;
            if (!event_type_.empty()) {
                event.event = event_type_;
            }
            event.data = data_;
            event.id = last_id_;
            out.push_back(std::move(event));
        }
        event_type_.clear();
        data_.clear();
        has_data_ = false;
        return;
    }
    if (line.front() == ':') {
        return;
    }

    std::string_view field = line;
    std::string_view value;
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "data") {
        if (has_data_) {
            data_ += '\n';
        }
        data_.append(value.data(), value.size());
        has_data_ = true;
    } else if (field == "event") {
        event_type_ = std::string(value);
    } else if (field == "id") {
        last_id_ = std::string(value);
    } else if (field == "retry") {
        if (!value.empty() && value.size() < 10 &&
            std::all_of(value.begin(), value.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
            retry_ms_ = std::stol(std::string(value));
        }
    }
}

} // namespace mcp_bridge
