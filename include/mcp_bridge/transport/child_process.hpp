#pragma once

#include <mcp_bridge/transport/i_process_pipe.hpp>

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// ChildProcess: IProcessPipe over a POSIX child process.
//
// Spawn() forks and execs `command` (resolved through PATH) with three pipes
// for stdin, stdout and stderr. The child inherits the parent environment
// with `env` entries added or overridden. An exec failure in the child is
// reported back through a close-on-exec status pipe, so Spawn() returns an
// Error instead of a process that dies immediately.
//
// The parent's end of stdin is non-blocking; WriteLine waits for room with
// poll() in short slices. A line longer than MaxLineLength() on stdout or
// stderr is dropped with a warning.
// ---------------------------------------------------------------------------
class ChildProcess : public IProcessPipe {
public:
    static Result<std::unique_ptr<ChildProcess>, Error> Spawn(
        const std::string& command,
        const std::vector<std::string>& args,
        const std::map<std::string, std::string>& env = {});

    ~ChildProcess() override;

    static constexpr std::size_t kDefaultMaxLineLength = 16 * 1024 * 1024;

    [[nodiscard]] Result<void, Error> WriteLine(
        std::string_view line, std::chrono::milliseconds timeout) override;

    [[nodiscard]] Result<PipeRead, Error> ReadLine(
        std::chrono::milliseconds slice) override;

    [[nodiscard]] Result<PipeRead, Error> ReadErrorLine(
        std::chrono::milliseconds slice) override;

    void CloseStdin() override;

    [[nodiscard]] bool WaitForExit(std::chrono::milliseconds timeout) override;

    void Kill() override;

    [[nodiscard]] int Pid() const override { return pid_; }

    /// Exit status once the process has been reaped.
    [[nodiscard]] std::optional<int> ExitStatus() const;

    void SetMaxLineLength(std::size_t bytes) { max_line_length_ = bytes; }
    [[nodiscard]] std::size_t MaxLineLength() const { return max_line_length_; }

private:
    ChildProcess(int pid, int stdin_fd, int stdout_fd, int stderr_fd);

    // Buffered line reader over one file descriptor.
    struct LineReader {
        int fd = -1;
        std::string buffer;
        bool eof = false;
        bool discarding = false;  // inside an overlong line, skip to its newline
    };

    Result<PipeRead, Error> ReadFrom(LineReader& reader,
                                     std::chrono::milliseconds slice,
                                     const char* stream_name);
    void Consume(LineReader& reader, const char* data, std::size_t size,
                 const char* stream_name);
    bool TryReap();

    int pid_;
    std::mutex stdin_mutex_;
    std::atomic<bool> stdin_closing_{false};
    int stdin_fd_;
    std::size_t max_line_length_ = kDefaultMaxLineLength;
    LineReader stdout_;
    LineReader stderr_;

    mutable std::mutex state_mutex_;
    bool reaped_ = false;
    std::optional<int> exit_status_;
};

} // namespace mcp_bridge
