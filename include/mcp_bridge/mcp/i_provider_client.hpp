#pragma once

#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/tool_types.hpp>

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// ClientOptions: timing shared by every provider client variant.
// ---------------------------------------------------------------------------
struct ClientOptions {
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds ready_poll_interval{1000};
    std::chrono::milliseconds read_slice{100};
    std::chrono::milliseconds graceful_exit{3000};
    std::chrono::milliseconds kill_wait{2000};
    std::size_t stderr_capacity = 1000;
};

// ---------------------------------------------------------------------------
// IProviderClient: capability interface of one connected tool provider.
//
// Implemented by StdioProviderClient (JSON-RPC over a child process),
// HttpProviderClient and SseProviderClient. The ToolManager depends on this
// interface only; tests use MockProviderClient.
//
// Methods return Result<T, Error> and never throw on expected failures.
// ---------------------------------------------------------------------------
class IProviderClient {
public:
    virtual ~IProviderClient() = default;

    IProviderClient(const IProviderClient&) = delete;
    IProviderClient& operator=(const IProviderClient&) = delete;
    IProviderClient(IProviderClient&&) = delete;
    IProviderClient& operator=(IProviderClient&&) = delete;

    [[nodiscard]] virtual const std::string& Name() const = 0;

    // -- Catalog -------------------------------------------------------------

    [[nodiscard]] virtual Result<std::vector<ToolInfo>, Error> ListTools() = 0;

    /// Resource descriptors as returned by the provider (a JSON array).
    [[nodiscard]] virtual Result<nlohmann::json, Error> ListResources() = 0;

    // -- Invocation ----------------------------------------------------------

    /// Run one tool. The provider's raw payload is returned un-normalized.
    [[nodiscard]] virtual Result<nlohmann::json, Error> ExecuteTool(
        const std::string& tool_name,
        const nlohmann::json& arguments) = 0;

    [[nodiscard]] virtual Result<nlohmann::json, Error> AccessResource(
        const std::string& uri) = 0;

    // -- Lifecycle -----------------------------------------------------------

    /// Poll until the provider answers a tool listing or `timeout` elapses.
    [[nodiscard]] virtual bool WaitUntilReady(std::chrono::milliseconds timeout) = 0;

    /// Captured diagnostic output, drained. Empty for network providers.
    [[nodiscard]] virtual std::vector<std::string> GetStderrMessages() = 0;

    /// Release the transport. Idempotent, never throws.
    virtual void Close() = 0;

protected:
    IProviderClient() = default;
};

} // namespace mcp_bridge
