#include <mcp_bridge/registry/tool_normalization.hpp>
#include <mcp_bridge/registry/tool_manager.hpp>

#include <mcp_bridge/core/log.hpp>

#include <sstream>

namespace mcp_bridge {

namespace {

std::string FirstContentText(const nlohmann::json& content) {
    if (content.is_array() && !content.empty() && content[0].is_object() &&
        content[0].contains("text") && content[0]["text"].is_string()) {
        return content[0]["text"].get<std::string>();
    }
    if (content.is_string()) {
        return content.get<std::string>();
    }
    return {};
}

nlohmann::json NormalizeContent(const nlohmann::json& content) {
    if (content.is_array() && !content.empty()) {
        const auto& first = content[0];
        if (first.is_object() && first.contains("text")) {
            return first["text"];
        }
        return first.dump();
    }
    if (content.is_string()) {
        return content;
    }
    return content.dump();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// CoerceArguments
// ---------------------------------------------------------------------------
Result<nlohmann::json, std::string> CoerceArguments(const nlohmann::json& arguments) {
    using R = Result<nlohmann::json, std::string>;
    if (arguments.is_null()) {
        return R::Ok(nlohmann::json::object());
    }
    if (arguments.is_object()) {
        return R::Ok(arguments);
    }
    if (arguments.is_array()) {
        auto object = nlohmann::json::object();
        for (const auto& pair : arguments) {
            if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string()) {
                return R::Err("Invalid arguments format: expected an object or "
                              "a list of [key, value] pairs");
            }
            object[pair[0].get<std::string>()] = pair[1];
        }
        return R::Ok(std::move(object));
    }
    if (arguments.is_string()) {
        auto parsed = nlohmann::json::parse(arguments.get<std::string>(), nullptr,
                                            /*allow_exceptions=*/false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            return R::Ok(std::move(parsed));
        }
    }
    return R::Err(std::string("Invalid arguments format: ") + arguments.type_name());
}

// ---------------------------------------------------------------------------
// Argument fixups
// ---------------------------------------------------------------------------
const std::vector<ArgumentFixup>& ArgumentFixups() {
    static const std::vector<ArgumentFixup> kFixups = {
        {"brave_web_search", {{"q", "query"}}, {"query"}},
    };
    return kFixups;
}

Result<void, Error> ApplyArgumentFixups(const std::string& provider_name,
                                        const std::string& tool_name,
                                        nlohmann::json& arguments) {
    for (const auto& fixup : ArgumentFixups()) {
        if (fixup.tool_name != tool_name) {
            continue;
        }
        for (const auto& [from, to] : fixup.aliases) {
            if (arguments.contains(from) && !arguments.contains(to)) {
                arguments[to] = arguments[from];
                arguments.erase(from);
                LogInfo("registry", "Renamed argument '" + from + "' to '" + to +
                        "' for " + tool_name);
            }
        }
        for (const auto& key : fixup.required) {
            if (!arguments.contains(key)) {
                LogError("registry", "Missing required '" + key + "' argument for " +
                         tool_name);
                return Result<void, Error>::Err(Error{
                    "Execute", provider_name + "/" + tool_name,
                    "Missing required '" + key + "' parameter",
                    ErrorCategory::MissingArgument});
            }
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// NormalizeToolResult
// ---------------------------------------------------------------------------
ToolResult NormalizeToolResult(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return ToolResult::Success(raw);
    }

    if (raw.contains("error") && !raw["error"].is_null() && raw["error"] != false) {
        const auto& error = raw["error"];
        if (error.is_string()) {
            return ToolResult::Failure(error.get<std::string>());
        }
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            return ToolResult::Failure(error["message"].get<std::string>());
        }
        return ToolResult::Failure(error.dump());
    }

    if (raw.contains("isError") && raw["isError"].is_boolean() &&
        raw["isError"].get<bool>()) {
        auto text = raw.contains("content") ? FirstContentText(raw["content"]) : "";
        return ToolResult::Failure(text.empty() ? "Tool reported an error" : text);
    }

    if (raw.contains("content")) {
        return ToolResult::Success(NormalizeContent(raw["content"]));
    }
    if (raw.contains("result")) {
        return ToolResult::Success(raw["result"]);
    }
    return ToolResult::Success(raw);
}

std::string ToolPayloadText(const nlohmann::json& payload) {
    if (payload.is_string()) {
        return payload.get<std::string>();
    }
    return payload.dump();
}

// ---------------------------------------------------------------------------
// FormatToolCatalog
// ---------------------------------------------------------------------------
std::string FormatToolCatalog(const std::vector<ToolInfo>& tools) {
    std::ostringstream out;
    bool first = true;
    for (const auto& tool : tools) {
        if (tool.provider_name == ToolManager::kMetaProvider &&
            tool.tool_name == ToolManager::kMetaTool) {
            continue;
        }
        if (!first) {
            out << '\n';
        }
        first = false;
        out << "- Provider: " << tool.provider_name << ", Tool: " << tool.tool_name << '\n'
            << "  Description: " << tool.description << '\n'
            << "  Input schema: " << tool.input_schema.dump();
    }
    if (first) {
        return "No tools available.";
    }
    return out.str();
}

} // namespace mcp_bridge
