#pragma once

#include <mcp_bridge/mcp/i_provider_client.hpp>
#include <mcp_bridge/mcp/json_rpc_session.hpp>
#include <mcp_bridge/transport/i_process_pipe.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// HandshakeState: lifecycle of a pipe-based provider connection.
//
//   Uninitialized -> Initializing -> Ready -> Closed
//
// A failed handshake stays in Initializing and is retried by the next call.
// ---------------------------------------------------------------------------
enum class HandshakeState {
    Uninitialized,
    Initializing,
    Ready,
    Closed,
};

const char* HandshakeStateName(HandshakeState state);

// ---------------------------------------------------------------------------
// StdioProviderClient: MCP client over a child process's stdin/stdout.
//
// Every catalog or invocation call first ensures the handshake has
// completed:
//   initialize (protocol 2024-11-05) -> initialized notification
// ---------------------------------------------------------------------------
class StdioProviderClient : public IProviderClient {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr const char* kClientName = "mcp-bridge";

    StdioProviderClient(std::string name,
                        std::unique_ptr<IProcessPipe> process,
                        const ClientOptions& options = {});

    ~StdioProviderClient() override;

    [[nodiscard]] const std::string& Name() const override { return name_; }

    [[nodiscard]] Result<std::vector<ToolInfo>, Error> ListTools() override;
    [[nodiscard]] Result<nlohmann::json, Error> ListResources() override;

    [[nodiscard]] Result<nlohmann::json, Error> ExecuteTool(
        const std::string& tool_name,
        const nlohmann::json& arguments) override;

    [[nodiscard]] Result<nlohmann::json, Error> AccessResource(
        const std::string& uri) override;

    [[nodiscard]] bool WaitUntilReady(std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::vector<std::string> GetStderrMessages() override;

    void Close() override;

    [[nodiscard]] HandshakeState State() const;

    /// Server info and capabilities from the initialize response.
    [[nodiscard]] nlohmann::json ServerInfo() const;

private:
    using Deadline = std::chrono::steady_clock::time_point;

    // Each request inside waits at most until `deadline`.
    Result<void, Error> EnsureInitialized(Deadline deadline);
    Result<nlohmann::json, Error> Call(const std::string& method,
                                       const nlohmann::json& params);
    Result<nlohmann::json, Error> Call(const std::string& method,
                                       const nlohmann::json& params,
                                       Deadline deadline);
    Result<std::vector<ToolInfo>, Error> ListToolsBefore(Deadline deadline);

    std::string name_;
    ClientOptions options_;
    std::unique_ptr<JsonRpcSession> session_;

    // Serializes handshake attempts; state reads use state_mutex_.
    std::mutex init_mutex_;
    mutable std::mutex state_mutex_;
    HandshakeState state_ = HandshakeState::Uninitialized;
    nlohmann::json server_info_;
};

} // namespace mcp_bridge
