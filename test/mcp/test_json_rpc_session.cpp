#include <catch2/catch_test_macros.hpp>

#include "../../test/mocks/fake_process_pipe.hpp"

#include <mcp_bridge/mcp/json_rpc_session.hpp>

#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace mcp_bridge;
using namespace mcp_bridge::testing;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

RpcSessionOptions FastOptions() {
    RpcSessionOptions options;
    options.request_timeout = 2000ms;
    options.read_slice = 20ms;
    options.graceful_exit = 200ms;
    options.kill_wait = 200ms;
    return options;
}

// Answers every request with {"echo": method, "params": params}.
void EchoResponder(FakeProcessPipe& pipe, const std::string& line) {
    auto message = json::parse(line);
    if (!message.contains("id")) {
        return;
    }
    pipe.PushStdout(json{{"jsonrpc", "2.0"},
                         {"id", message["id"]},
                         {"result", {{"echo", message["method"]},
                                     {"params", message["params"]}}}}
                        .dump());
}

std::string Response(std::int64_t id, const json& result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump();
}

} // anonymous namespace

// ===========================================================================
// Request / response
// ===========================================================================

TEST_CASE("JsonRpcSession: request receives its response", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    fake->SetResponder(EchoResponder);
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    auto result = session.SendRequest("tools/list");
    REQUIRE(result.IsOk());
    CHECK(result.Value()["echo"] == "tools/list");
    CHECK(result.Value()["params"] == json::object());

    auto written = json::parse(fake->Written().at(0));
    CHECK(written["jsonrpc"] == "2.0");
    CHECK(written["id"] == 1);
    CHECK(session.PendingCount() == 0);
}

TEST_CASE("JsonRpcSession: ids increase monotonically", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    fake->SetResponder(EchoResponder);
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    REQUIRE(session.SendRequest("a").IsOk());
    REQUIRE(session.SendRequest("b").IsOk());
    REQUIRE(session.SendRequest("c").IsOk());

    auto written = fake->Written();
    REQUIRE(written.size() == 3);
    CHECK(json::parse(written[0])["id"] == 1);
    CHECK(json::parse(written[1])["id"] == 2);
    CHECK(json::parse(written[2])["id"] == 3);
}

TEST_CASE("JsonRpcSession: out-of-order responses reach the right caller", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    auto first = std::async(std::launch::async, [&] { return session.SendRequest("first"); });
    REQUIRE(fake->WaitForWrites(1));
    auto second = std::async(std::launch::async, [&] { return session.SendRequest("second"); });
    REQUIRE(fake->WaitForWrites(2));

    fake->PushStdout(Response(2, "answer-2"));
    fake->PushStdout(Response(1, "answer-1"));

    auto r1 = first.get();
    auto r2 = second.get();
    REQUIRE(r1.IsOk());
    REQUIRE(r2.IsOk());
    CHECK(r1.Value() == "answer-1");
    CHECK(r2.Value() == "answer-2");
}

TEST_CASE("JsonRpcSession: concurrent callers are matched by id", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    pipe->SetResponder(EchoResponder);
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    constexpr int kThreads = 6;
    constexpr int kRequests = 20;
    std::vector<std::future<int>> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.push_back(std::async(std::launch::async, [&session, t] {
            int matched = 0;
            for (int i = 0; i < kRequests; ++i) {
                json params = {{"worker", t}, {"seq", i}};
                auto r = session.SendRequest("work", params);
                if (r.IsOk() && r.Value()["params"] == params) {
                    ++matched;
                }
            }
            return matched;
        }));
    }
    for (auto& worker : workers) {
        CHECK(worker.get() == kRequests);
    }
    CHECK(session.PendingCount() == 0);
}

TEST_CASE("JsonRpcSession: error response becomes an Error", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    pipe->SetResponder([](FakeProcessPipe& p, const std::string& line) {
        auto id = json::parse(line)["id"];
        p.PushStdout(json{{"jsonrpc", "2.0"}, {"id", id},
                          {"error", {{"code", -32000}, {"message", "quota exceeded"}}}}
                         .dump());
    });
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    auto result = session.SendRequest("tools/call");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ToolExecution);
    CHECK(result.Error().rpc_code == std::optional<int>(-32000));
    CHECK(result.Error().message == "quota exceeded");
    CHECK(result.Error().operation == "tools/call");
    CHECK(result.Error().endpoint == "demo");
}

// ===========================================================================
// Robustness
// ===========================================================================

TEST_CASE("JsonRpcSession: timeout removes the pending request", "[rpc]") {
    auto options = FastOptions();
    options.request_timeout = 100ms;
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    JsonRpcSession session("demo", std::move(pipe), options);

    auto result = session.SendRequest("slow");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    CHECK(session.PendingCount() == 0);

    // The late answer is discarded; the session keeps working.
    fake->PushStdout(Response(1, "too late"));
    fake->SetResponder(EchoResponder);
    auto next = session.SendRequest("fast");
    REQUIRE(next.IsOk());
    CHECK(next.Value()["echo"] == "fast");
}

TEST_CASE("JsonRpcSession: malformed lines are skipped", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    auto pending = std::async(std::launch::async, [&] { return session.SendRequest("x"); });
    REQUIRE(fake->WaitForWrites(1));
    fake->PushStdout("this is not json");
    fake->PushStdout("{\"jsonrpc\":\"2.0\",\"id\":");
    fake->PushStdout("");
    fake->PushStdout(R"({"jsonrpc":"2.0","method":"notifications/message","params":{}})");
    fake->PushStdout(Response(1, "ok"));

    auto result = pending.get();
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "ok");
}

TEST_CASE("JsonRpcSession: answers provider-initiated requests", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    fake->PushStdout(R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})");
    fake->PushStdout(R"({"jsonrpc":"2.0","id":"srv-2","method":"sampling/createMessage"})");
    REQUIRE(fake->WaitForWrites(2));

    auto written = fake->Written();
    auto ping = json::parse(written[0]);
    CHECK(ping["id"] == "srv-1");
    CHECK(ping["result"] == json::object());

    auto unsupported = json::parse(written[1]);
    CHECK(unsupported["id"] == "srv-2");
    CHECK(unsupported["error"]["code"] == -32601);
}

TEST_CASE("JsonRpcSession: write failure is reported and not left pending", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    pipe->FailWrites(Error{"WriteLine", "fake", "broken pipe", ErrorCategory::Transport});
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    auto result = session.SendRequest("tools/list");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Transport);
    CHECK(result.Error().operation == "tools/list");
    CHECK(session.PendingCount() == 0);
}

TEST_CASE("JsonRpcSession: notifications are written without an id", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    REQUIRE(session.SendNotification("notifications/initialized").IsOk());
    auto written = json::parse(fake->Written().at(0));
    CHECK_FALSE(written.contains("id"));
    CHECK(written["method"] == "notifications/initialized");
}

// ===========================================================================
// Stderr capture
// ===========================================================================

TEST_CASE("JsonRpcSession: stderr lines are drained in order", "[rpc][stdio]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    fake->PushStderr("starting");
    fake->PushStderr("ready");
    REQUIRE(fake->WaitForStderrConsumed());
    std::this_thread::sleep_for(50ms);

    CHECK(session.DrainStderr() == std::vector<std::string>{"starting", "ready"});
    CHECK(session.DrainStderr().empty());
}

TEST_CASE("JsonRpcSession: stderr buffer keeps the newest lines", "[rpc][stdio]") {
    auto options = FastOptions();
    options.stderr_capacity = 3;
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    JsonRpcSession session("demo", std::move(pipe), options);

    for (int i = 1; i <= 5; ++i) {
        fake->PushStderr("line " + std::to_string(i));
    }
    REQUIRE(fake->WaitForStderrConsumed());
    std::this_thread::sleep_for(50ms);

    CHECK(session.DrainStderr() ==
          std::vector<std::string>{"line 3", "line 4", "line 5"});
}

// ===========================================================================
// Shutdown
// ===========================================================================

TEST_CASE("JsonRpcSession: close rejects pending requests", "[rpc]") {
    auto options = FastOptions();
    options.request_timeout = 10000ms;
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    JsonRpcSession session("demo", std::move(pipe), options);

    auto pending = std::async(std::launch::async, [&] { return session.SendRequest("hang"); });
    REQUIRE(fake->WaitForWrites(1));

    session.Close();
    auto result = pending.get();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Transport);
    CHECK(session.IsClosed());
}

TEST_CASE("JsonRpcSession: close shuts a cooperative process down", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    session.Close();
    CHECK(fake->StdinClosed());
    CHECK(fake->Exited());
    CHECK_FALSE(fake->Killed());

    session.Close();  // second close is a no-op

    auto after = session.SendRequest("tools/list");
    REQUIRE(after.IsErr());
    CHECK(after.Error().category == ErrorCategory::Transport);
    CHECK(session.SendNotification("x").IsErr());
}

TEST_CASE("JsonRpcSession: close is bounded when the process never exits", "[rpc]") {
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    fake->SetNeverExit();
    JsonRpcSession session("demo", std::move(pipe), FastOptions());

    const auto started = std::chrono::steady_clock::now();
    session.Close();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(fake->Killed());
    CHECK(elapsed < 2000ms);
}

TEST_CASE("JsonRpcSession: provider EOF leaves the session usable for close", "[rpc]") {
    auto options = FastOptions();
    options.request_timeout = 150ms;
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    JsonRpcSession session("demo", std::move(pipe), options);

    fake->EndStdout();
    auto result = session.SendRequest("tools/list");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    session.Close();
}

// ===========================================================================
// Provider that stops reading its stdin
// ===========================================================================

TEST_CASE("JsonRpcSession: request to a stalled stdin times out", "[rpc]") {
    auto options = FastOptions();
    options.request_timeout = 150ms;
    auto pipe = std::make_unique<FakeProcessPipe>();
    pipe->SetStalledStdin();
    JsonRpcSession session("demo", std::move(pipe), options);

    const auto started = std::chrono::steady_clock::now();
    auto result = session.SendRequest("tools/list");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    CHECK(result.Error().operation == "tools/list");
    CHECK(session.PendingCount() == 0);
    CHECK(elapsed < 1000ms);
}

TEST_CASE("JsonRpcSession: close releases a caller stuck writing", "[rpc]") {
    auto options = FastOptions();
    options.request_timeout = 10000ms;
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    fake->SetStalledStdin();
    fake->SetNeverExit();
    JsonRpcSession session("demo", std::move(pipe), options);

    auto pending = std::async(std::launch::async, [&] { return session.SendRequest("hang"); });
    REQUIRE(fake->WaitForStalledWriter());

    const auto started = std::chrono::steady_clock::now();
    session.Close();
    CHECK(std::chrono::steady_clock::now() - started < 2000ms);

    auto result = pending.get();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Transport);
    CHECK(fake->Killed());
}

TEST_CASE("JsonRpcSession: close releases a reader stuck answering the provider", "[rpc]") {
    auto options = FastOptions();
    options.request_timeout = 10000ms;
    auto pipe = std::make_unique<FakeProcessPipe>();
    auto* fake = pipe.get();
    fake->SetStalledStdin();
    JsonRpcSession session("demo", std::move(pipe), options);

    fake->PushStdout(R"({"jsonrpc":"2.0","id":"p1","method":"ping"})");
    REQUIRE(fake->WaitForStalledWriter());

    const auto started = std::chrono::steady_clock::now();
    session.Close();
    CHECK(std::chrono::steady_clock::now() - started < 2000ms);
    CHECK(fake->StdinClosed());
}
