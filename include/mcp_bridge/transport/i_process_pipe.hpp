#pragma once

#include <mcp_bridge/core/result.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// PipeRead: outcome of one bounded read from a process stream.
// ---------------------------------------------------------------------------
enum class PipeReadStatus {
    Line,     // `line` holds one complete line without the trailing newline
    Timeout,  // nothing arrived within the slice; try again
    Eof,      // the stream is closed; no further lines will arrive
};

struct PipeRead {
    PipeReadStatus status = PipeReadStatus::Timeout;
    std::string line;
};

// ---------------------------------------------------------------------------
// IProcessPipe: abstract line-oriented channel to a provider process.
//
// The JSON-RPC session depends on this interface rather than on a concrete
// child process, which enables offline testing via FakeProcessPipe.
//
// Threading contract:
//   - ReadLine is only called from one thread (the protocol reader).
//   - ReadErrorLine is only called from one thread (the stderr drainer).
//   - WriteLine and CloseStdin may be called from any thread; implementations
//     serialize writes internally. CloseStdin must not wait behind a write
//     that is stuck on a full pipe: it makes that write fail instead.
//
// Reads take a time slice and return Timeout when it elapses, so a reader
// loop can observe cancellation between slices instead of blocking forever.
// ---------------------------------------------------------------------------
class IProcessPipe {
public:
    virtual ~IProcessPipe() = default;

    IProcessPipe(const IProcessPipe&) = delete;
    IProcessPipe& operator=(const IProcessPipe&) = delete;
    IProcessPipe(IProcessPipe&&) = delete;
    IProcessPipe& operator=(IProcessPipe&&) = delete;

    // -- Streams -------------------------------------------------------------

    /// Write one line to the process's stdin. A newline is appended.
    /// Fails with Timeout when the provider does not drain its stdin within
    /// `timeout`, and with Transport when stdin is or gets closed.
    [[nodiscard]] virtual Result<void, Error> WriteLine(
        std::string_view line, std::chrono::milliseconds timeout) = 0;

    /// Read one line from the process's stdout.
    [[nodiscard]] virtual Result<PipeRead, Error> ReadLine(
        std::chrono::milliseconds slice) = 0;

    /// Read one line from the process's stderr.
    [[nodiscard]] virtual Result<PipeRead, Error> ReadErrorLine(
        std::chrono::milliseconds slice) = 0;

    // -- Lifecycle -----------------------------------------------------------

    /// Close the write side of stdin. Well-behaved providers exit on EOF.
    /// A write in progress on another thread is abandoned.
    virtual void CloseStdin() = 0;

    /// Wait up to `timeout` for the process to exit. Returns true if it has.
    [[nodiscard]] virtual bool WaitForExit(std::chrono::milliseconds timeout) = 0;

    /// Forcibly terminate the process.
    virtual void Kill() = 0;

    [[nodiscard]] virtual int Pid() const = 0;

protected:
    IProcessPipe() = default;
};

} // namespace mcp_bridge
