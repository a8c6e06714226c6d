#include <mcp_bridge/mcp/stdio_provider_client.hpp>

#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/version.hpp>

#include <algorithm>
#include <thread>

namespace mcp_bridge {

const char* HandshakeStateName(HandshakeState state) {
    switch (state) {
        case HandshakeState::Uninitialized: return "uninitialized";
        case HandshakeState::Initializing:  return "initializing";
        case HandshakeState::Ready:         return "ready";
        case HandshakeState::Closed:        return "closed";
    }
    return "unknown";
}

namespace {

RpcSessionOptions ToSessionOptions(const ClientOptions& options) {
    RpcSessionOptions out;
    out.request_timeout = options.request_timeout;
    out.read_slice = options.read_slice;
    out.graceful_exit = options.graceful_exit;
    out.kill_wait = options.kill_wait;
    out.stderr_capacity = options.stderr_capacity;
    return out;
}

nlohmann::json MakeInitializeParams() {
    return {
        {"protocolVersion", StdioProviderClient::kProtocolVersion},
        {"capabilities", {
            {"roots", {{"listChanged", true}}},
            {"sampling", nlohmann::json::object()}
        }},
        {"clientInfo", {
            {"name", StdioProviderClient::kClientName},
            {"version", kVersion}
        }}
    };
}

// Time left before `deadline`, or zero once it has passed.
std::chrono::milliseconds TimeLeft(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds::zero());
}

} // anonymous namespace

StdioProviderClient::StdioProviderClient(std::string name,
                                         std::unique_ptr<IProcessPipe> process,
                                         const ClientOptions& options)
    : name_(std::move(name)),
      options_(options),
      session_(std::make_unique<JsonRpcSession>(name_, std::move(process),
                                                ToSessionOptions(options))) {}

StdioProviderClient::~StdioProviderClient() {
    Close();
}

HandshakeState StdioProviderClient::State() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

nlohmann::json StdioProviderClient::ServerInfo() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------
Result<void, Error> StdioProviderClient::EnsureInitialized(Deadline deadline) {
    // Callers arriving during a handshake queue here behind it.
    std::lock_guard<std::mutex> init_lock(init_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == HandshakeState::Ready) {
            return Result<void, Error>::Ok();
        }
        if (state_ == HandshakeState::Closed) {
            return Result<void, Error>::Err(Error{
                "initialize", name_, "Client is closed", ErrorCategory::Transport});
        }
        state_ = HandshakeState::Initializing;
    }

    LogDebug("stdio", name_ + ": sending initialize");
    auto left = TimeLeft(deadline);
    if (left == std::chrono::milliseconds::zero()) {
        return Result<void, Error>::Err(Error{
            "initialize", name_, "No time left for the handshake",
            ErrorCategory::Timeout});
    }
    auto init = session_->SendRequest("initialize", MakeInitializeParams(), left);
    if (init.IsErr()) {
        LogWarn("stdio", name_ + ": handshake failed: " + init.Error().ToString());
        return Result<void, Error>::Err(init.Error());
    }
    if (!init.Value().is_object()) {
        return Result<void, Error>::Err(Error{
            "initialize", name_, "initialize result is not an object",
            ErrorCategory::Protocol});
    }

    auto notified = session_->SendNotification("initialized");
    if (notified.IsErr()) {
        LogWarn("stdio", name_ + ": failed to send initialized notification: " +
                notified.Error().ToString());
        return notified;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == HandshakeState::Closed) {
        return Result<void, Error>::Err(Error{
            "initialize", name_, "Client is closed", ErrorCategory::Transport});
    }
    server_info_ = init.Value();
    state_ = HandshakeState::Ready;
    auto version = server_info_.value("protocolVersion", std::string("?"));
    LogInfo("stdio", name_ + ": ready (protocol " + version + ")");
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> StdioProviderClient::Call(const std::string& method,
                                                        const nlohmann::json& params) {
    return Call(method, params, std::chrono::steady_clock::now() + options_.request_timeout);
}

Result<nlohmann::json, Error> StdioProviderClient::Call(const std::string& method,
                                                        const nlohmann::json& params,
                                                        Deadline deadline) {
    auto ready = EnsureInitialized(deadline);
    if (ready.IsErr()) {
        return Result<nlohmann::json, Error>::Err(ready.Error());
    }
    auto left = TimeLeft(deadline);
    if (left == std::chrono::milliseconds::zero()) {
        return Result<nlohmann::json, Error>::Err(Error{
            method, name_, "No time left after the handshake", ErrorCategory::Timeout});
    }
    return session_->SendRequest(method, params, left);
}

// ---------------------------------------------------------------------------
// IProviderClient
// ---------------------------------------------------------------------------
Result<std::vector<ToolInfo>, Error> StdioProviderClient::ListTools() {
    return ListToolsBefore(std::chrono::steady_clock::now() + options_.request_timeout);
}

Result<std::vector<ToolInfo>, Error> StdioProviderClient::ListToolsBefore(Deadline deadline) {
    auto listing = Call("tools/list", nlohmann::json::object(), deadline);
    if (listing.IsErr()) {
        return Result<std::vector<ToolInfo>, Error>::Err(listing.Error());
    }
    return ParseToolCatalog(name_, listing.Value());
}

Result<nlohmann::json, Error> StdioProviderClient::ListResources() {
    auto listing = Call("resources/list", nlohmann::json::object());
    if (listing.IsErr()) {
        return listing;
    }
    return ParseResourceList(name_, listing.Value());
}

Result<nlohmann::json, Error> StdioProviderClient::ExecuteTool(
    const std::string& tool_name,
    const nlohmann::json& arguments) {
    return Call("tools/call", {{"name", tool_name}, {"arguments", arguments}});
}

Result<nlohmann::json, Error> StdioProviderClient::AccessResource(const std::string& uri) {
    return Call("resources/read", {{"uri", uri}});
}

bool StdioProviderClient::WaitUntilReady(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int attempt = 0;
    for (;;) {
        ++attempt;
        // Handshake and listing share what is left of the ready deadline.
        auto attempt_deadline = std::min(
            deadline, std::chrono::steady_clock::now() + options_.request_timeout);
        auto tools = ListToolsBefore(attempt_deadline);
        if (tools.IsOk()) {
            LogInfo("stdio", name_ + ": " + std::to_string(tools.Value().size()) +
                    " tool(s) available after " + std::to_string(attempt) +
                    " attempt(s)");
            return true;
        }
        if (State() == HandshakeState::Closed) {
            return false;
        }
        LogDebug("stdio", name_ + ": not ready yet: " + tools.Error().ToString());

        auto now = std::chrono::steady_clock::now();
        if (now + options_.ready_poll_interval >= deadline) {
            LogWarn("stdio", name_ + ": not ready within " +
                    std::to_string(timeout.count()) + "ms");
            return false;
        }
        std::this_thread::sleep_for(options_.ready_poll_interval);
    }
}

std::vector<std::string> StdioProviderClient::GetStderrMessages() {
    return session_->DrainStderr();
}

void StdioProviderClient::Close() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == HandshakeState::Closed) {
            return;
        }
        state_ = HandshakeState::Closed;
    }
    LogDebug("stdio", name_ + ": closing");
    session_->Close();
}

} // namespace mcp_bridge
