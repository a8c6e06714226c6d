#pragma once

#include <mcp_bridge/core/result.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// ToolInfo: one tool advertised by a provider. `input_schema` is passed
// through verbatim.
// ---------------------------------------------------------------------------
struct ToolInfo {
    std::string provider_name;
    std::string tool_name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();

    bool operator==(const ToolInfo& other) const {
        return provider_name == other.provider_name &&
               tool_name == other.tool_name &&
               description == other.description &&
               input_schema == other.input_schema;
    }
};

// ---------------------------------------------------------------------------
// ToolCall: a request from the model to run one tool.
// ---------------------------------------------------------------------------
struct ToolCall {
    std::string provider_name;
    std::string tool_name;
    nlohmann::json arguments = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// ToolResult: normalized outcome of a tool invocation. When `error` is set
// the call failed and `payload` is null.
// ---------------------------------------------------------------------------
struct ToolResult {
    nlohmann::json payload;
    std::optional<std::string> error;

    [[nodiscard]] bool IsError() const noexcept { return error.has_value(); }

    static ToolResult Success(nlohmann::json value) {
        return ToolResult{std::move(value), std::nullopt};
    }
    static ToolResult Failure(std::string message) {
        return ToolResult{nullptr, std::move(message)};
    }
};

/// Parse a tool listing. Accepts a bare array or {"tools": [...]}, and both
/// "inputSchema" and "input_schema". Entries without a name are skipped.
Result<std::vector<ToolInfo>, Error> ParseToolCatalog(
    const std::string& provider_name,
    const nlohmann::json& listing);

/// Parse a resource listing. Accepts a bare array or {"resources": [...]}.
Result<nlohmann::json, Error> ParseResourceList(
    const std::string& provider_name,
    const nlohmann::json& listing);

} // namespace mcp_bridge
