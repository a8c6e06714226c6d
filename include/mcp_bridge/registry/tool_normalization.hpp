#pragma once

#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/tool_types.hpp>

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// Argument shape fixups and result normalization applied by the ToolManager
// around every tool invocation.
// ---------------------------------------------------------------------------

/// Coerce model-produced arguments to a JSON object:
///   null                          -> {}
///   object                        -> unchanged
///   array of [key, value] pairs   -> object
///   string holding a JSON object  -> parsed object
/// Anything else is an error message.
Result<nlohmann::json, std::string> CoerceArguments(const nlohmann::json& arguments);

// One row of the per-tool fixup table: rename aliased keys, then require
// the listed keys.
struct ArgumentFixup {
    std::string tool_name;
    std::vector<std::pair<std::string, std::string>> aliases;  // from -> to
    std::vector<std::string> required;
};

const std::vector<ArgumentFixup>& ArgumentFixups();

/// Apply the fixup row for `tool_name`, if any. A required key still missing
/// afterwards is a MissingArgument error.
Result<void, Error> ApplyArgumentFixups(const std::string& provider_name,
                                        const std::string& tool_name,
                                        nlohmann::json& arguments);

/// Reduce a raw provider payload to one value. Precedence:
///   content[0].text  >  content[0] serialized  >  content string
///   >  result field  >  whole payload
/// `isError: true` or a top-level `error` field yields a failed ToolResult.
ToolResult NormalizeToolResult(const nlohmann::json& raw);

/// Text form of a result payload: strings as-is, everything else dumped.
std::string ToolPayloadText(const nlohmann::json& payload);

/// Human-readable listing of `tools` for the meta tool. The meta tool itself
/// is never listed; an empty listing reads "No tools available.".
std::string FormatToolCatalog(const std::vector<ToolInfo>& tools);

} // namespace mcp_bridge
