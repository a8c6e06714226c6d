#include <mcp_bridge/workflow/text_tool_protocol.hpp>

#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/registry/tool_manager.hpp>

#include <sstream>

namespace mcp_bridge {

namespace {

// Top-level {...} spans of `text`, skipping braces inside JSON strings.
std::vector<std::string_view> FindJsonObjects(std::string_view text) {
    std::vector<std::string_view> spans;
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    size_t start = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"' && depth > 0) {
            in_string = true;
        } else if (c == '{') {
            if (depth == 0) {
                start = i;
            }
            ++depth;
        } else if (c == '}' && depth > 0) {
            --depth;
            if (depth == 0) {
                spans.push_back(text.substr(start, i - start + 1));
            }
        }
    }
    return spans;
}

std::string_view Trim(std::string_view s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool ToToolCall(const nlohmann::json& candidate, ToolCall& out) {
    if (!candidate.is_object() || !candidate.contains("tool_call")) {
        return false;
    }
    const auto& call = candidate["tool_call"];
    if (!call.is_object() ||
        !call.contains("server_name") || !call["server_name"].is_string() ||
        !call.contains("tool_name") || !call["tool_name"].is_string()) {
        return false;
    }
    out.provider_name = call["server_name"].get<std::string>();
    out.tool_name = call["tool_name"].get<std::string>();
    out.arguments = call.contains("arguments") ? call["arguments"]
                                               : nlohmann::json::object();
    return true;
}

} // anonymous namespace

std::string RenderToolCatalog(const std::vector<ToolInfo>& tools) {
    std::ostringstream out;
    out << "Available tools:\n";
    for (const auto& tool : tools) {
        out << "- Provider: " << tool.provider_name << ", Tool: " << tool.tool_name << '\n'
            << "  Description: " << tool.description << '\n'
            << "  Input schema: " << tool.input_schema.dump() << '\n';
    }
    out << '\n'
        << "If you need a tool, reply with a single JSON object in this format:\n"
        << R"({"tool_call": {"server_name": "...", "tool_name": "...", "arguments": {...}}})"
        << '\n'
        << "To list every available tool:\n"
        << R"({"tool_call": {"server_name": ")" << ToolManager::kMetaProvider
        << R"(", "tool_name": ")" << ToolManager::kMetaTool
        << R"(", "arguments": {}}})" << '\n'
        << "Otherwise, reply with plain text.\n";
    return out.str();
}

LlmReply ParseToolCallReply(std::string_view reply) {
    for (auto span : FindJsonObjects(reply)) {
        auto candidate = nlohmann::json::parse(span.begin(), span.end(), nullptr,
                                               /*allow_exceptions=*/false);
        if (candidate.is_discarded()) {
            continue;
        }
        ToolCall call;
        if (ToToolCall(candidate, call)) {
            LogDebug("orchestrator", "Parsed tool call " + call.provider_name + "/" +
                     call.tool_name);
            return call;
        }
    }
    return std::string(Trim(reply));
}

} // namespace mcp_bridge
