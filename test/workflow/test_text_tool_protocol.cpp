#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/registry/tool_manager.hpp>
#include <mcp_bridge/workflow/text_tool_protocol.hpp>

using namespace mcp_bridge;
using nlohmann::json;

namespace {

const ToolCall* AsCall(const LlmReply& reply) {
    return std::get_if<ToolCall>(&reply);
}

const std::string* AsText(const LlmReply& reply) {
    return std::get_if<std::string>(&reply);
}

} // anonymous namespace

// ===========================================================================
// ParseToolCallReply
// ===========================================================================

TEST_CASE("ParseToolCallReply: bare tool call", "[protocol]") {
    auto reply = ParseToolCallReply(
        R"({"tool_call": {"server_name": "weather", "tool_name": "forecast", "arguments": {"city": "Oslo"}}})");
    const auto* call = AsCall(reply);
    REQUIRE(call != nullptr);
    CHECK(call->provider_name == "weather");
    CHECK(call->tool_name == "forecast");
    CHECK(call->arguments == json{{"city", "Oslo"}});
}

TEST_CASE("ParseToolCallReply: fenced and surrounded by prose", "[protocol]") {
    auto reply = ParseToolCallReply(
        "Let me look that up.\n"
        "```json\n"
        "{\"tool_call\": {\"server_name\": \"brave\", \"tool_name\": \"brave_web_search\", "
        "\"arguments\": {\"query\": \"a {b} c\"}}}\n"
        "```\n"
        "One moment.");
    const auto* call = AsCall(reply);
    REQUIRE(call != nullptr);
    CHECK(call->provider_name == "brave");
    CHECK(call->arguments["query"] == "a {b} c");
}

TEST_CASE("ParseToolCallReply: missing arguments default to an object", "[protocol]") {
    auto reply = ParseToolCallReply(
        R"({"tool_call": {"server_name": "meta", "tool_name": "list_mcp_tools"}})");
    const auto* call = AsCall(reply);
    REQUIRE(call != nullptr);
    CHECK(call->arguments == json::object());
}

TEST_CASE("ParseToolCallReply: first valid call wins over other objects", "[protocol]") {
    auto reply = ParseToolCallReply(
        R"(Example {"not": "a call"} then {"tool_call": {"server_name": "a", "tool_name": "b"}})");
    const auto* call = AsCall(reply);
    REQUIRE(call != nullptr);
    CHECK(call->provider_name == "a");
}

TEST_CASE("ParseToolCallReply: plain text is trimmed", "[protocol]") {
    auto reply = ParseToolCallReply("  \n The answer is 42.\n\n");
    const auto* text = AsText(reply);
    REQUIRE(text != nullptr);
    CHECK(*text == "The answer is 42.");
}

TEST_CASE("ParseToolCallReply: malformed calls fall back to text", "[protocol]") {
    for (const char* input : {
             R"({"tool_call": {"server_name": "weather"}})",
             R"({"tool_call": "weather/forecast"})",
             R"({"tool_call": {"server_name": 1, "tool_name": "x"}})",
             R"({"tool_call": {"server_name": "a", "tool_name": )",
             "Use braces like } and { freely",
         }) {
        INFO(input);
        auto reply = ParseToolCallReply(input);
        CHECK(AsText(reply) != nullptr);
    }
}

TEST_CASE("ParseToolCallReply: empty reply is empty text", "[protocol]") {
    auto reply = ParseToolCallReply("");
    const auto* text = AsText(reply);
    REQUIRE(text != nullptr);
    CHECK(text->empty());
}

// ===========================================================================
// RenderToolCatalog
// ===========================================================================

TEST_CASE("RenderToolCatalog: lists tools and the calling convention", "[protocol]") {
    std::vector<ToolInfo> tools = {
        ToolManager::MetaToolInfo(),
        {"weather", "forecast", "Weather forecast", {{"type", "object"}}},
    };
    auto text = RenderToolCatalog(tools);

    CHECK(text.find("Available tools:\n") == 0);
    CHECK(text.find("- Provider: weather, Tool: forecast\n"
                    "  Description: Weather forecast\n"
                    "  Input schema: {\"type\":\"object\"}\n") != std::string::npos);
    CHECK(text.find("- Provider: meta, Tool: list_mcp_tools") != std::string::npos);
    CHECK(text.find(R"("server_name": "meta", "tool_name": "list_mcp_tools")") !=
          std::string::npos);
    CHECK(text.find("Otherwise, reply with plain text.") != std::string::npos);
}

TEST_CASE("RenderToolCatalog: rendered example parses back as a call", "[protocol]") {
    auto text = RenderToolCatalog({});
    auto marker = text.find("To list every available tool:\n");
    REQUIRE(marker != std::string::npos);

    auto reply = ParseToolCallReply(text.substr(marker));
    const auto* call = AsCall(reply);
    REQUIRE(call != nullptr);
    CHECK(call->provider_name == "meta");
    CHECK(call->tool_name == "list_mcp_tools");
}
