#pragma once

#include <mcp_bridge/core/bounded_queue.hpp>
#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/transport/i_process_pipe.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// RpcSessionOptions: timing and capacity knobs for a JsonRpcSession.
// ---------------------------------------------------------------------------
struct RpcSessionOptions {
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds read_slice{100};
    std::chrono::milliseconds graceful_exit{3000};
    std::chrono::milliseconds kill_wait{2000};
    std::size_t stderr_capacity = 1000;
};

// ---------------------------------------------------------------------------
// JsonRpcSession: JSON-RPC 2.0 over a line-oriented process pipe.
//
// Owns the pipe and two background threads:
//   - reader: parses stdout lines and resolves pending requests by id
//   - stderr drainer: copies stderr lines into a bounded queue
//
// SendRequest blocks the calling thread until the matching response arrives
// or the request timeout elapses. Requests from several threads may be in
// flight at once; writes are serialized and responses are matched strictly
// by id, in any order.
// ---------------------------------------------------------------------------
class JsonRpcSession {
public:
    JsonRpcSession(std::string name,
                   std::unique_ptr<IProcessPipe> pipe,
                   const RpcSessionOptions& options = {});

    ~JsonRpcSession();

    JsonRpcSession(const JsonRpcSession&) = delete;
    JsonRpcSession& operator=(const JsonRpcSession&) = delete;
    JsonRpcSession(JsonRpcSession&&) = delete;
    JsonRpcSession& operator=(JsonRpcSession&&) = delete;

    /// Send a request and wait for its result. Errors:
    ///   Transport  write failed or session closed
    ///   Timeout    write plus response took longer than the request timeout
    ///   Protocol/ToolExecution  the peer answered with a JSON-RPC error
    [[nodiscard]] Result<nlohmann::json, Error> SendRequest(
        const std::string& method,
        const nlohmann::json& params = nlohmann::json::object());

    /// Same, with `timeout` in place of the session's request timeout.
    [[nodiscard]] Result<nlohmann::json, Error> SendRequest(
        const std::string& method,
        const nlohmann::json& params,
        std::chrono::milliseconds timeout);

    /// Fire-and-forget notification.
    [[nodiscard]] Result<void, Error> SendNotification(
        const std::string& method,
        const nlohmann::json& params = nlohmann::json::object());

    /// Drain captured stderr lines (oldest first). Never blocks.
    [[nodiscard]] std::vector<std::string> DrainStderr();

    [[nodiscard]] std::size_t PendingCount() const;

    [[nodiscard]] bool IsClosed() const noexcept { return closed_; }

    /// Stop both threads, shut the process down, reject pending requests.
    /// Idempotent.
    void Close();

private:
    struct PendingRequest {
        std::string method;
        std::chrono::steady_clock::time_point created_at;
        std::promise<Result<nlohmann::json, Error>> completion;
    };

    void ReaderLoop();
    void StderrLoop();
    void Dispatch(const std::string& line);
    void AnswerPeerRequest(const nlohmann::json& message);
    Result<void, Error> WriteMessage(const nlohmann::json& message,
                                     std::chrono::milliseconds timeout);
    void RejectAllPending(const std::string& reason);
    void ShutdownProcess();

    std::string name_;
    std::unique_ptr<IProcessPipe> pipe_;
    RpcSessionOptions options_;

    mutable std::mutex pending_mutex_;
    std::map<std::int64_t, std::shared_ptr<PendingRequest>> pending_;
    std::int64_t next_id_ = 1;

    std::mutex write_mutex_;
    BoundedQueue<std::string> stderr_lines_;

    std::mutex close_mutex_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> closed_{false};
    std::thread reader_;
    std::thread stderr_reader_;
};

} // namespace mcp_bridge
