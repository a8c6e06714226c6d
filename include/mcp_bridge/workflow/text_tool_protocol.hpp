#pragma once

#include <mcp_bridge/mcp/tool_types.hpp>
#include <mcp_bridge/workflow/i_llm_generator.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// Text tool-call protocol for models without native tool calling.
//
// The catalog and calling convention are rendered into the prompt; the
// model answers either with plain text or with
//   {"tool_call": {"server_name": "...", "tool_name": "...", "arguments": {...}}}
// ---------------------------------------------------------------------------

/// Catalog plus calling instructions, ready to prepend to a system prompt.
std::string RenderToolCatalog(const std::vector<ToolInfo>& tools);

/// Interpret a model reply. A tool_call object anywhere in the text (bare,
/// inside ```json fences, or surrounded by prose) yields a ToolCall; any
/// other reply is returned as text, trimmed.
LlmReply ParseToolCallReply(std::string_view reply);

} // namespace mcp_bridge
