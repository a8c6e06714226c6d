#include <mcp_bridge/workflow/tool_orchestrator.hpp>

#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/registry/tool_normalization.hpp>

namespace mcp_bridge {

namespace {

std::string DescribeCall(const ToolCall& call) {
    return call.provider_name + "/" + call.tool_name + " " + call.arguments.dump();
}

} // anonymous namespace

std::string TruncateToolOutput(const std::string& output, std::size_t max_chars) {
    // Characters are UTF-8 code points: continuation bytes (10xxxxxx) are
    // not counted, and the cut never lands inside a sequence.
    auto is_continuation = [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    };

    std::size_t chars = 0;
    std::size_t cut = output.size();
    for (std::size_t i = 0; i < output.size(); ++i) {
        if (is_continuation(output[i])) {
            continue;
        }
        if (chars == max_chars) {
            cut = i;
        }
        ++chars;
    }
    if (chars <= max_chars) {
        return output;
    }
    return output.substr(0, cut) + "\n... [output truncated: showing " +
           std::to_string(max_chars) + " of " + std::to_string(chars) +
           " characters]";
}

std::string BuildToolOutputPrompt(const std::string& user_prompt,
                                  const ToolCall& call,
                                  const std::string& output) {
    return "Original request: " + user_prompt + "\n\n" +
           "The tool " + call.provider_name + "/" + call.tool_name +
           " returned:\n" + output + "\n\n" +
           "Given this tool output, either call another tool or give the final "
           "answer to the original request.";
}

std::string BuildToolFailurePrompt(const std::string& user_prompt,
                                   const ToolCall& call,
                                   const std::string& error) {
    return "Original request: " + user_prompt + "\n\n" +
           "The previous tool call " + call.provider_name + "/" + call.tool_name +
           " failed with: " + error + "\n\n" +
           "Retry with corrected arguments, use a different tool, or answer "
           "the original request directly.";
}

ToolOrchestrator::ToolOrchestrator(ILlmGenerator& generator,
                                   ToolManager& tools,
                                   const OrchestratorOptions& options)
    : generator_(generator), tools_(tools), options_(options) {}

OrchestrationResult ToolOrchestrator::Run(const std::string& user_prompt,
                                          const std::vector<ConversationTurn>& history) {
    OrchestrationResult result;
    const auto catalog = tools_.ListAllTools();
    const std::vector<ConversationTurn> no_history;

    std::string prompt = user_prompt;
    for (int iteration = 1; iteration <= options_.max_iterations; ++iteration) {
        result.iterations = iteration;
        result.transcript.push_back({"user", prompt});
        LogDebug("orchestrator", "Iteration " + std::to_string(iteration) + " of " +
                 std::to_string(options_.max_iterations));

        auto reply = generator_.Generate(prompt, catalog,
                                         iteration == 1 ? history : no_history);
        if (reply.IsErr()) {
            LogWarn("orchestrator", "Generator failed: " + reply.Error().ToString());
            prompt = "Original request: " + user_prompt + "\n\n" +
                     "The previous attempt failed with: " + reply.Error().message +
                     "\n\nAnswer the original request directly.";
            continue;
        }

        if (const auto* text = std::get_if<std::string>(&reply.Value())) {
            LogInfo("orchestrator", "Final answer after " + std::to_string(iteration) +
                    " iteration(s)");
            result.reply = *text;
            result.transcript.push_back({"assistant", *text});
            return result;
        }

        const auto& call = std::get<ToolCall>(reply.Value());
        LogInfo("orchestrator", "Model requested " + DescribeCall(call));
        result.transcript.push_back({"assistant", "tool call: " + DescribeCall(call)});

        auto executed = tools_.Execute(call.provider_name, call.tool_name, call.arguments);
        if (executed.IsErr()) {
            const auto& error = executed.Error();
            LogWarn("orchestrator", "Tool call rejected: " + error.ToString());
            result.transcript.push_back({"tool", "error: " + error.message});
            prompt = BuildToolFailurePrompt(user_prompt, call, error.message);
            continue;
        }
        const auto& tool_result = executed.Value();
        if (tool_result.IsError()) {
            result.transcript.push_back({"tool", "error: " + *tool_result.error});
            prompt = BuildToolFailurePrompt(user_prompt, call, *tool_result.error);
            continue;
        }

        auto output = TruncateToolOutput(ToolPayloadText(tool_result.payload),
                                         options_.max_tool_output);
        auto diagnostics = tools_.GetStderrMessages(call.provider_name);
        if (!diagnostics.empty()) {
            output += "\n\nProvider diagnostics:";
            for (const auto& line : diagnostics) {
                output += "\n" + line;
            }
        }
        result.transcript.push_back({"tool", output});
        prompt = BuildToolOutputPrompt(user_prompt, call, output);
    }

    LogWarn("orchestrator", "No final answer after " +
            std::to_string(options_.max_iterations) + " iteration(s)");
    result.exhausted = true;
    result.reply = kFallbackMessage;
    return result;
}

} // namespace mcp_bridge
