#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/mcp/sse_parser.hpp>

using namespace mcp_bridge;

TEST_CASE("SseParser: single event", "[sse]") {
    SseParser parser;
    auto events = parser.Feed("data: hello\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "message");
    CHECK(events[0].data == "hello");
    CHECK(events[0].id.empty());
}

TEST_CASE("SseParser: event type, id and multi-line data", "[sse]") {
    SseParser parser;
    auto events = parser.Feed(
        "event: tools_changed\n"
        "id: 7\n"
        "data: line one\n"
        "data: line two\n"
        "\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "tools_changed");
    CHECK(events[0].id == "7");
    CHECK(events[0].data == "line one\nline two");
    CHECK(parser.LastEventId() == "7");
}

TEST_CASE("SseParser: lines split across chunks", "[sse]") {
    SseParser parser;
    CHECK(parser.Feed("da").empty());
    CHECK(parser.Feed("ta: {\"a\":").empty());
    CHECK(parser.Feed("1}\n").empty());
    auto events = parser.Feed("\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "{\"a\":1}");
}

TEST_CASE("SseParser: CRLF line endings", "[sse]") {
    SseParser parser;
    auto events = parser.Feed("event: ping\r\ndata: x\r\n\r\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "ping");
    CHECK(events[0].data == "x");
}

TEST_CASE("SseParser: several events in one chunk", "[sse]") {
    SseParser parser;
    auto events = parser.Feed("data: a\n\ndata: b\n\ndata: c\n");
    REQUIRE(events.size() == 2);
    CHECK(events[0].data == "a");
    CHECK(events[1].data == "b");

    auto rest = parser.Feed("\n");
    REQUIRE(rest.size() == 1);
    CHECK(rest[0].data == "c");
}

TEST_CASE("SseParser: comments and empty events are not dispatched", "[sse]") {
    SseParser parser;
    auto events = parser.Feed(": keep-alive\n\nevent: noop\n\n");
    CHECK(events.empty());

    // The event type does not leak into the next event.
    auto next = parser.Feed("data: after\n\n");
    REQUIRE(next.size() == 1);
    CHECK(next[0].event == "message");
}

TEST_CASE("SseParser: field without a value and without a space", "[sse]") {
    SseParser parser;
    auto events = parser.Feed("data\ndata:tight\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "\ntight");
}

TEST_CASE("SseParser: id carries over to later events", "[sse]") {
    SseParser parser;
    auto events = parser.Feed("id: 41\ndata: one\n\ndata: two\n\n");
    REQUIRE(events.size() == 2);
    CHECK(events[0].id == "41");
    CHECK(events[1].id == "41");
}

TEST_CASE("SseParser: retry hint", "[sse]") {
    SseParser parser;
    CHECK_FALSE(parser.RetryMs().has_value());

    parser.Feed("retry: 2500\n\n");
    REQUIRE(parser.RetryMs().has_value());
    CHECK(*parser.RetryMs() == 2500);

    parser.Feed("retry: soon\n\n");
    CHECK(*parser.RetryMs() == 2500);
}

TEST_CASE("SseParser: unknown fields are ignored", "[sse]") {
    SseParser parser;
    auto events = parser.Feed("foo: bar\ndata: ok\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "ok");
}
