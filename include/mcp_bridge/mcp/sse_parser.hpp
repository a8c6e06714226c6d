#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// SseEvent: one dispatched server-sent event.
// ---------------------------------------------------------------------------
struct SseEvent {
    std::string event = "message";
    std::string data;
    std::string id;
};

// ---------------------------------------------------------------------------
// SseParser: incremental text/event-stream decoder.
//
// Feed() accepts arbitrary chunks (lines may be split across chunks) and
// returns the events completed by a blank line. Comment lines (":...") are
// ignored; an event with no data lines is not dispatched.
// ---------------------------------------------------------------------------
class SseParser {
public:
    std::vector<SseEvent> Feed(std::string_view chunk);

    /// Last "retry:" value in milliseconds, if the server sent one.
    [[nodiscard]] std::optional<long> RetryMs() const noexcept { return retry_ms_; }

    /// Last event id seen, carried across events.
    [[nodiscard]] const std::string& LastEventId() const noexcept { return last_id_; }

private:
    void ProcessLine(std::string_view line, std::vector<SseEvent>& out);

    std::string buffer_;
    std::string event_type_;
    std::string data_;
    bool has_data_ = false;
    std::string last_id_;
    std::optional<long> retry_ms_;
};

} // namespace mcp_bridge
