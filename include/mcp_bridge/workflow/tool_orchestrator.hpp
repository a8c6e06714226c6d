#pragma once

#include <mcp_bridge/registry/tool_manager.hpp>
#include <mcp_bridge/workflow/i_llm_generator.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace mcp_bridge {

struct OrchestratorOptions {
    int max_iterations = 3;
    std::size_t max_tool_output = 2000;
};

// ---------------------------------------------------------------------------
// OrchestrationResult: what one Run() produced.
// ---------------------------------------------------------------------------
struct OrchestrationResult {
    std::string reply;
    int iterations = 0;       // generator round trips used
    bool exhausted = false;   // true when `reply` is the fallback message
    std::vector<ConversationTurn> transcript;  // prompts, tool calls, outputs
};

// ---------------------------------------------------------------------------
// ToolOrchestrator: bounded ask-model / run-tool loop.
//
//   AwaitingModel -> (ToolRequested -> ToolExecuted -> AwaitingModel) | Done
//
// Each round trip asks the generator for a reply. Text ends the run; a tool
// call is executed through the ToolManager and its (truncated) output or
// error becomes the next prompt. A failing call or generator error consumes
// an iteration but never aborts the run. When the iterations run out the
// fallback message is returned.
// ---------------------------------------------------------------------------
class ToolOrchestrator {
public:
    static constexpr const char* kFallbackMessage =
        "Sorry, I could not complete this request with the available tools. "
        "Please try rephrasing it.";

    ToolOrchestrator(ILlmGenerator& generator,
                     ToolManager& tools,
                     const OrchestratorOptions& options = {});

    [[nodiscard]] OrchestrationResult Run(const std::string& user_prompt,
                                          const std::vector<ConversationTurn>& history = {});

private:
    ILlmGenerator& generator_;
    ToolManager& tools_;
    OrchestratorOptions options_;
};

/// Cut `output` to `max_chars` UTF-8 characters and append a truncation
/// notice when longer.
std::string TruncateToolOutput(const std::string& output, std::size_t max_chars);

std::string BuildToolOutputPrompt(const std::string& user_prompt,
                                  const ToolCall& call,
                                  const std::string& output);

std::string BuildToolFailurePrompt(const std::string& user_prompt,
                                   const ToolCall& call,
                                   const std::string& error);

} // namespace mcp_bridge
