#include <mcp_bridge/mcp/json_rpc_session.hpp>
#include <mcp_bridge/mcp/json_rpc.hpp>
#include <mcp_bridge/core/log.hpp>

namespace mcp_bridge {

namespace {

std::string SecondsText(std::chrono::milliseconds ms) {
    auto tenths = ms.count() / 100;
    auto text = std::to_string(tenths / 10);
    if (tenths % 10 != 0) {
        text += "." + std::to_string(tenths % 10);
    }
    return text + "s";
}

std::string Abbreviate(const std::string& line) {
    constexpr size_t kMaxLogLine = 200;
    if (line.size() <= kMaxLogLine) {
        return line;
    }
    return line.substr(0, kMaxLogLine) + "...";
}

} // anonymous namespace

JsonRpcSession::JsonRpcSession(std::string name,
                               std::unique_ptr<IProcessPipe> pipe,
                               const RpcSessionOptions& options)
    : name_(std::move(name)),
      pipe_(std::move(pipe)),
      options_(options),
      stderr_lines_(options.stderr_capacity) {
    reader_ = std::thread([this] { ReaderLoop(); });
    stderr_reader_ = std::thread([this] { StderrLoop(); });
}

JsonRpcSession::~JsonRpcSession() {
    Close();
}

// ---------------------------------------------------------------------------
// Outbound
// ---------------------------------------------------------------------------
Result<void, Error> JsonRpcSession::WriteMessage(const nlohmann::json& message,
                                                 std::chrono::milliseconds timeout) {
    auto line = message.dump();
    LogDebug("rpc", name_ + " --> " + Abbreviate(line));
    std::lock_guard<std::mutex> lock(write_mutex_);
    return pipe_->WriteLine(line, timeout);
}

Result<nlohmann::json, Error> JsonRpcSession::SendRequest(
    const std::string& method,
    const nlohmann::json& params) {
    return SendRequest(method, params, options_.request_timeout);
}

Result<nlohmann::json, Error> JsonRpcSession::SendRequest(
    const std::string& method,
    const nlohmann::json& params,
    std::chrono::milliseconds timeout) {
    using R = Result<nlohmann::json, Error>;

    if (closed_) {
        return R::Err(Error{method, name_, "Session is closed",
                            ErrorCategory::Transport});
    }

    auto pending = std::make_shared<PendingRequest>();
    pending->method = method;
    pending->created_at = std::chrono::steady_clock::now();
    // The write counts against the request timeout.
    const auto deadline = pending->created_at + timeout;
    auto future = pending->completion.get_future();

    std::int64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        // Re-checked under the lock: Close() rejects pending requests once,
        // so a request registered after that would never be answered.
        if (closed_) {
            return R::Err(Error{method, name_, "Session is closed",
                                ErrorCategory::Transport});
        }
        id = next_id_++;
        pending_.emplace(id, pending);
    }

    auto written = WriteMessage(MakeRpcRequest(id, method, params), timeout);
    if (written.IsErr()) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.erase(id);
        }
        auto error = std::move(written).Error();
        error.operation = method;
        error.endpoint = name_;
        return R::Err(std::move(error));
    }

    if (future.wait_until(deadline) != std::future_status::ready) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            removed = pending_.erase(id) > 0;
        }
        // The reader may have resolved the request between the wait and
        // the erase; in that case the answer is already in the future.
        if (removed) {
            LogWarn("rpc", name_ + ": request " + std::to_string(id) + " ('" +
                    method + "') timed out after " + SecondsText(timeout));
            return R::Err(Error{method, name_,
                                "No response within " + SecondsText(timeout),
                                ErrorCategory::Timeout});
        }
    }
    return future.get();
}

Result<void, Error> JsonRpcSession::SendNotification(
    const std::string& method,
    const nlohmann::json& params) {
    if (closed_) {
        return Result<void, Error>::Err(Error{method, name_, "Session is closed",
                                              ErrorCategory::Transport});
    }
    return WriteMessage(MakeRpcNotification(method, params), options_.request_timeout);
}

// ---------------------------------------------------------------------------
// Inbound
// ---------------------------------------------------------------------------
void JsonRpcSession::ReaderLoop() {
    while (!stop_) {
        auto read = pipe_->ReadLine(options_.read_slice);
        if (read.IsErr()) {
            LogError("rpc", name_ + ": reader stopped: " + read.Error().ToString());
            return;
        }
        const auto& chunk = read.Value();
        switch (chunk.status) {
            case PipeReadStatus::Timeout:
                continue;
            case PipeReadStatus::Eof:
                LogInfo("rpc", name_ + ": provider closed its output");
                return;
            case PipeReadStatus::Line:
                if (!chunk.line.empty()) {
                    Dispatch(chunk.line);
                }
                break;
        }
    }
}

void JsonRpcSession::StderrLoop() {
    while (!stop_) {
        auto read = pipe_->ReadErrorLine(options_.read_slice);
        if (read.IsErr()) {
            LogWarn("stdio", name_ + ": stderr capture stopped: " +
                    read.Error().ToString());
            return;
        }
        const auto& chunk = read.Value();
        if (chunk.status == PipeReadStatus::Eof) {
            return;
        }
        if (chunk.status == PipeReadStatus::Line) {
            LogDebug("stdio", name_ + " stderr: " + chunk.line);
            if (!stderr_lines_.Push(chunk.line) && stderr_lines_.DroppedCount() == 1) {
                LogWarn("stdio", name_ + ": stderr buffer full, dropping oldest lines");
            }
        }
    }
}

void JsonRpcSession::Dispatch(const std::string& line) {
    auto message = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (message.is_discarded()) {
        LogWarn("rpc", name_ + ": skipping malformed line: " + Abbreviate(line));
        return;
    }
    LogDebug("rpc", name_ + " <-- " + Abbreviate(line));

    switch (ClassifyRpcMessage(message)) {
        case RpcMessageKind::Notification:
            LogInfo("rpc", name_ + ": notification '" +
                    message["method"].get<std::string>() + "'");
            return;
        case RpcMessageKind::Request:
            AnswerPeerRequest(message);
            return;
        case RpcMessageKind::Invalid:
            LogWarn("rpc", name_ + ": ignoring message that is neither a "
                    "response nor a notification");
            return;
        case RpcMessageKind::Response:
        case RpcMessageKind::ErrorResponse:
            break;
    }

    auto id = RpcResponseId(message);
    std::shared_ptr<PendingRequest> pending;
    if (id) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(*id);
        if (it != pending_.end()) {
            pending = it->second;
            pending_.erase(it);
        }
    }
    if (!pending) {
        LogDebug("rpc", name_ + ": discarding response with unknown id " +
                 message["id"].dump());
        return;
    }

    if (message.contains("error")) {
        pending->completion.set_value(Result<nlohmann::json, Error>::Err(
            Error::FromRpcError(pending->method, name_, message["error"].dump())));
    } else {
        pending->completion.set_value(
            Result<nlohmann::json, Error>::Ok(message["result"]));
    }
}

// Providers may ping the client or ask for its roots; anything else is
// answered with "method not found" so the provider does not wait on us.
void JsonRpcSession::AnswerPeerRequest(const nlohmann::json& message) {
    const auto method = message["method"].get<std::string>();
    LogInfo("rpc", name_ + ": provider request '" + method + "'");

    nlohmann::json reply;
    if (method == "ping") {
        reply = MakeRpcResult(message["id"], nlohmann::json::object());
    } else if (method == "roots/list") {
        reply = MakeRpcResult(message["id"], {{"roots", nlohmann::json::array()}});
    } else {
        reply = MakeRpcError(message["id"], kRpcMethodNotFound,
                             "Method not supported by client: " + method);
    }
    auto written = WriteMessage(reply, options_.request_timeout);
    if (written.IsErr()) {
        LogWarn("rpc", name_ + ": failed to answer '" + method + "': " +
                written.Error().ToString());
    }
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------
std::vector<std::string> JsonRpcSession::DrainStderr() {
    return stderr_lines_.DrainAll();
}

std::size_t JsonRpcSession::PendingCount() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void JsonRpcSession::RejectAllPending(const std::string& reason) {
    std::map<std::int64_t, std::shared_ptr<PendingRequest>> orphaned;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        orphaned.swap(pending_);
    }
    for (auto& [id, pending] : orphaned) {
        pending->completion.set_value(Result<nlohmann::json, Error>::Err(
            Error{pending->method, name_, reason, ErrorCategory::Transport}));
    }
}

// Stdin is already closed by Close().
void JsonRpcSession::ShutdownProcess() {
    if (pipe_->WaitForExit(options_.graceful_exit)) {
        return;
    }
    LogWarn("stdio", name_ + ": provider (pid " + std::to_string(pipe_->Pid()) +
            ") did not exit within " + SecondsText(options_.graceful_exit) +
            ", killing");
    pipe_->Kill();
    if (!pipe_->WaitForExit(options_.kill_wait)) {
        LogWarn("stdio", name_ + ": provider (pid " + std::to_string(pipe_->Pid()) +
                ") still running after kill, giving up");
    }
}

void JsonRpcSession::Close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    LogDebug("rpc", name_ + ": closing session");

    RejectAllPending("Session closed before a response arrived");

    // Closing stdin before the joins releases a reader or caller that is
    // stuck writing to a provider which stopped reading.
    stop_ = true;
    pipe_->CloseStdin();
    if (reader_.joinable()) {
        reader_.join();
    }
    if (stderr_reader_.joinable()) {
        stderr_reader_.join();
    }

    ShutdownProcess();
}

} // namespace mcp_bridge
