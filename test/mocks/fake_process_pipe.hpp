#pragma once

#include <mcp_bridge/transport/i_process_pipe.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcp_bridge {
namespace testing {

// ---------------------------------------------------------------------------
// FakeProcessPipe: in-memory provider process for offline unit testing.
//
// Usage:
//   auto pipe = std::make_unique<FakeProcessPipe>();
//   auto* fake = pipe.get();
//   fake->SetResponder([](FakeProcessPipe& p, const std::string& line) {
//       p.PushStdout(R"({"jsonrpc":"2.0","id":1,"result":{}})");
//   });
//   JsonRpcSession session("demo", std::move(pipe));
//
// Lines written by the client are recorded (see Written/WaitForWrites) and
// optionally handed to a responder, which runs on the writing thread and may
// push replies. By default the fake "exits" when its stdin is closed; call
// SetNeverExit() to simulate a provider that ignores EOF and SIGKILL.
// SetStalledStdin() makes every write hang like a full pipe until its
// timeout passes or stdin is closed.
// ---------------------------------------------------------------------------
class FakeProcessPipe : public IProcessPipe {
public:
    using Responder = std::function<void(FakeProcessPipe&, const std::string& line)>;

    FakeProcessPipe() = default;

    // -- Scripting -----------------------------------------------------------

    void PushStdout(const std::string& line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stdout_.push_back(line);
        }
        cv_.notify_all();
    }

    void PushStderr(const std::string& line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stderr_.push_back(line);
        }
        cv_.notify_all();
    }

    // Simulate the provider closing its stdout (queued lines are still read).
    void EndStdout() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stdout_eof_ = true;
        }
        cv_.notify_all();
    }

    void SetResponder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void FailWrites(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_error_ = std::move(error);
    }

    void SetNeverExit() {
        std::lock_guard<std::mutex> lock(mutex_);
        never_exit_ = true;
    }

    void SetStalledStdin() {
        std::lock_guard<std::mutex> lock(mutex_);
        stalled_stdin_ = true;
    }

    // -- Inspection ----------------------------------------------------------

    [[nodiscard]] std::vector<std::string> Written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    // Block until at least `count` lines were written. False on timeout.
    bool WaitForWrites(std::size_t count,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return written_.size() >= count; });
    }

    // Block until the reader side has taken every queued stderr line.
    bool WaitForStderrConsumed(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return stderr_.empty(); });
    }

    // Block until a write is hanging on the stalled stdin.
    bool WaitForStalledWriter(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return stalled_writers_ > 0; });
    }

    [[nodiscard]] bool StdinClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stdin_closed_;
    }

    [[nodiscard]] bool Killed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return killed_;
    }

    [[nodiscard]] bool Exited() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return exited_;
    }

    // -- IProcessPipe implementation ------------------------------------------

    Result<void, Error> WriteLine(std::string_view line,
                                  std::chrono::milliseconds timeout) override {
        Responder responder;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stalled_stdin_ && !stdin_closed_) {
                ++stalled_writers_;
                cv_.notify_all();
                bool closed = cv_.wait_for(lock, timeout, [&] { return stdin_closed_; });
                --stalled_writers_;
                if (closed) {
                    return Result<void, Error>::Err(Error{
                        "WriteLine", "fake", "stdin closed during write",
                        ErrorCategory::Transport});
                }
                return Result<void, Error>::Err(Error{
                    "WriteLine", "fake", "Provider did not read its stdin",
                    ErrorCategory::Timeout});
            }
            if (write_error_.has_value()) {
                return Result<void, Error>::Err(*write_error_);
            }
            if (stdin_closed_ || exited_) {
                return Result<void, Error>::Err(Error{
                    "WriteLine", "fake", "FakeProcessPipe: stdin is closed",
                    ErrorCategory::Transport});
            }
            written_.emplace_back(line);
            responder = responder_;
        }
        cv_.notify_all();
        if (responder) {
            responder(*this, std::string(line));
        }
        return Result<void, Error>::Ok();
    }

    Result<PipeRead, Error> ReadLine(std::chrono::milliseconds slice) override {
        return ReadFrom(stdout_, /*is_stdout=*/true, slice);
    }

    Result<PipeRead, Error> ReadErrorLine(std::chrono::milliseconds slice) override {
        return ReadFrom(stderr_, /*is_stdout=*/false, slice);
    }

    void CloseStdin() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stdin_closed_ = true;
            if (!never_exit_) {
                exited_ = true;
            }
        }
        cv_.notify_all();
    }

    bool WaitForExit(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return exited_; });
    }

    void Kill() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            killed_ = true;
            if (!never_exit_) {
                exited_ = true;
            }
        }
        cv_.notify_all();
    }

    [[nodiscard]] int Pid() const override { return 4242; }

private:
    Result<PipeRead, Error> ReadFrom(std::deque<std::string>& queue, bool is_stdout,
                                     std::chrono::milliseconds slice) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [&] {
            return !queue.empty() || exited_ || (is_stdout && stdout_eof_);
        };
        if (!cv_.wait_for(lock, slice, ready)) {
            return Result<PipeRead, Error>::Ok(PipeRead{PipeReadStatus::Timeout, ""});
        }
        if (!queue.empty()) {
            PipeRead read{PipeReadStatus::Line, queue.front()};
            queue.pop_front();
            lock.unlock();
            cv_.notify_all();
            return Result<PipeRead, Error>::Ok(std::move(read));
        }
        return Result<PipeRead, Error>::Ok(PipeRead{PipeReadStatus::Eof, ""});
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> stdout_;
    std::deque<std::string> stderr_;
    std::vector<std::string> written_;
    Responder responder_;
    std::optional<Error> write_error_;
    bool stdout_eof_ = false;
    bool stdin_closed_ = false;
    bool exited_ = false;
    bool killed_ = false;
    bool never_exit_ = false;
    bool stalled_stdin_ = false;
    int stalled_writers_ = 0;
};

} // namespace testing
} // namespace mcp_bridge
