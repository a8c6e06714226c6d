#pragma once

#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/tool_types.hpp>

#include <string>
#include <variant>
#include <vector>

namespace mcp_bridge {

// One message of the running exchange ("user", "assistant", "tool").
struct ConversationTurn {
    std::string role;
    std::string content;
};

// A model reply is either final text or a request to run one tool.
using LlmReply = std::variant<std::string, ToolCall>;

// ---------------------------------------------------------------------------
// ILlmGenerator: boundary to a language-model adapter.
//
// Vendor integrations (prompt formatting, model selection, native tool
// schemas) live behind this interface. `history` is only non-empty on the
// first call of an orchestration run.
// ---------------------------------------------------------------------------
class ILlmGenerator {
public:
    virtual ~ILlmGenerator() = default;

    ILlmGenerator(const ILlmGenerator&) = delete;
    ILlmGenerator& operator=(const ILlmGenerator&) = delete;
    ILlmGenerator(ILlmGenerator&&) = delete;
    ILlmGenerator& operator=(ILlmGenerator&&) = delete;

    [[nodiscard]] virtual Result<LlmReply, Error> Generate(
        const std::string& prompt,
        const std::vector<ToolInfo>& tools,
        const std::vector<ConversationTurn>& history) = 0;

protected:
    ILlmGenerator() = default;
};

} // namespace mcp_bridge
