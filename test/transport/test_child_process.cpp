#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/transport/child_process.hpp>

#include <chrono>
#include <future>
#include <map>
#include <string>
#include <thread>

using namespace mcp_bridge;
using namespace std::chrono_literals;

namespace {

// Read until a line or EOF arrives, retrying timed-out slices.
PipeRead ReadWithin(IProcessPipe& pipe, bool from_stderr,
                    std::chrono::milliseconds total = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + total;
    while (std::chrono::steady_clock::now() < deadline) {
        auto read = from_stderr ? pipe.ReadErrorLine(100ms) : pipe.ReadLine(100ms);
        REQUIRE(read.IsOk());
        if (read.Value().status != PipeReadStatus::Timeout) {
            return read.Value();
        }
    }
    return PipeRead{PipeReadStatus::Timeout, ""};
}

std::unique_ptr<ChildProcess> SpawnShell(const std::string& script,
                                         const std::map<std::string, std::string>& env = {}) {
    auto spawned = ChildProcess::Spawn("/bin/sh", {"-c", script}, env);
    REQUIRE(spawned.IsOk());
    return std::move(spawned).Value();
}

} // anonymous namespace

TEST_CASE("ChildProcess: echoes lines through cat", "[process]") {
    auto spawned = ChildProcess::Spawn("cat", {});
    REQUIRE(spawned.IsOk());
    auto process = std::move(spawned).Value();
    CHECK(process->Pid() > 0);

    REQUIRE(process->WriteLine(R"({"jsonrpc":"2.0","id":1})", 1000ms).IsOk());
    auto read = ReadWithin(*process, false);
    CHECK(read.status == PipeReadStatus::Line);
    CHECK(read.line == R"({"jsonrpc":"2.0","id":1})");

    process->CloseStdin();
    CHECK(ReadWithin(*process, false).status == PipeReadStatus::Eof);
    CHECK(process->WaitForExit(2000ms));
    CHECK(process->ExitStatus() == std::optional<int>(0));
}

TEST_CASE("ChildProcess: read times out when nothing is written", "[process]") {
    auto spawned = ChildProcess::Spawn("cat", {});
    REQUIRE(spawned.IsOk());
    auto process = std::move(spawned).Value();

    auto read = process->ReadLine(50ms);
    REQUIRE(read.IsOk());
    CHECK(read.Value().status == PipeReadStatus::Timeout);
}

TEST_CASE("ChildProcess: stderr is a separate stream", "[process]") {
    auto process = SpawnShell("echo diagnostics >&2; echo result");

    auto out = ReadWithin(*process, false);
    CHECK(out.status == PipeReadStatus::Line);
    CHECK(out.line == "result");

    auto err = ReadWithin(*process, true);
    CHECK(err.status == PipeReadStatus::Line);
    CHECK(err.line == "diagnostics");
}

TEST_CASE("ChildProcess: final unterminated line and CRLF", "[process]") {
    auto process = SpawnShell("printf 'first\\r\\nlast'");

    CHECK(ReadWithin(*process, false).line == "first");
    auto last = ReadWithin(*process, false);
    CHECK(last.status == PipeReadStatus::Line);
    CHECK(last.line == "last");
    CHECK(ReadWithin(*process, false).status == PipeReadStatus::Eof);
}

TEST_CASE("ChildProcess: environment is inherited and extended", "[process]") {
    setenv("MCP_BRIDGE_PARENT_VAR", "parent", 1);
    auto process = SpawnShell("echo \"$MCP_BRIDGE_PARENT_VAR:$MCP_BRIDGE_CHILD_VAR\"",
                              {{"MCP_BRIDGE_CHILD_VAR", "child"}});
    unsetenv("MCP_BRIDGE_PARENT_VAR");

    CHECK(ReadWithin(*process, false).line == "parent:child");
}

TEST_CASE("ChildProcess: exit status is recorded", "[process]") {
    auto process = SpawnShell("exit 3");
    CHECK(process->WaitForExit(2000ms));
    CHECK(process->ExitStatus() == std::optional<int>(3));
}

TEST_CASE("ChildProcess: Kill terminates a process that ignores EOF", "[process]") {
    auto process = SpawnShell("trap '' TERM; while true; do sleep 1; done");

    process->CloseStdin();
    CHECK_FALSE(process->WaitForExit(200ms));

    process->Kill();
    CHECK(process->WaitForExit(2000ms));
    CHECK(process->ExitStatus() == std::optional<int>(128 + 9));
}

TEST_CASE("ChildProcess: write after CloseStdin fails", "[process]") {
    auto spawned = ChildProcess::Spawn("cat", {});
    REQUIRE(spawned.IsOk());
    auto process = std::move(spawned).Value();

    process->CloseStdin();
    auto written = process->WriteLine("late", 1000ms);
    REQUIRE(written.IsErr());
    CHECK(written.Error().category == ErrorCategory::Transport);
}

TEST_CASE("ChildProcess: unknown command is a Transport error", "[process]") {
    auto spawned = ChildProcess::Spawn("mcp-bridge-no-such-binary", {});
    REQUIRE(spawned.IsErr());
    CHECK(spawned.Error().category == ErrorCategory::Transport);
    CHECK(spawned.Error().operation == "Spawn");
}

TEST_CASE("ChildProcess: empty command is rejected", "[process]") {
    auto spawned = ChildProcess::Spawn("", {});
    CHECK(spawned.IsErr());
}

TEST_CASE("ChildProcess: write to a process that never reads times out", "[process]") {
    auto spawned = ChildProcess::Spawn("sleep", {"30"});
    REQUIRE(spawned.IsOk());
    auto process = std::move(spawned).Value();

    const std::string big(256 * 1024, 'x');
    const auto started = std::chrono::steady_clock::now();
    auto written = process->WriteLine(big, 300ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(written.IsErr());
    CHECK(written.Error().category == ErrorCategory::Timeout);
    CHECK(elapsed < 2000ms);

    // Half a line went out, so stdin is unusable now.
    auto next = process->WriteLine("{}", 100ms);
    REQUIRE(next.IsErr());
    CHECK(next.Error().category == ErrorCategory::Transport);

    process->Kill();
    CHECK(process->WaitForExit(2000ms));
}

TEST_CASE("ChildProcess: CloseStdin does not wait behind a stuck writer", "[process]") {
    auto spawned = ChildProcess::Spawn("sleep", {"30"});
    REQUIRE(spawned.IsOk());
    auto process = std::move(spawned).Value();

    const std::string big(256 * 1024, 'x');
    auto writer = std::async(std::launch::async,
                             [&] { return process->WriteLine(big, 20000ms); });
    std::this_thread::sleep_for(300ms);

    const auto started = std::chrono::steady_clock::now();
    process->CloseStdin();
    (void)process->WaitForExit(100ms);
    process->Kill();
    CHECK(process->WaitForExit(2000ms));
    CHECK(std::chrono::steady_clock::now() - started < 3000ms);

    auto written = writer.get();
    REQUIRE(written.IsErr());
    CHECK(written.Error().category == ErrorCategory::Transport);
}

TEST_CASE("ChildProcess: overlong output line is dropped", "[process]") {
    auto process = SpawnShell("head -c 5000 /dev/zero | tr '\\0' x; echo; echo after");
    process->SetMaxLineLength(1024);

    auto read = ReadWithin(*process, false);
    CHECK(read.status == PipeReadStatus::Line);
    CHECK(read.line == "after");
    CHECK(ReadWithin(*process, false).status == PipeReadStatus::Eof);
}
