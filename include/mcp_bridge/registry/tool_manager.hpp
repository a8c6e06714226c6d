#pragma once

#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/i_provider_client.hpp>
#include <mcp_bridge/mcp/tool_types.hpp>
#include <mcp_bridge/transport/i_process_pipe.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// ToolManager: registry of named provider clients.
//
// Aggregates every provider's tool catalog (plus the synthetic
// meta/list_mcp_tools tool), routes tool calls by provider name and applies
// argument fixups and result normalization around each call.
//
// Error policy for Execute():
//   - UnknownProvider and MissingArgument are returned as Err
//   - every other failure is folded into ToolResult{error}
// ---------------------------------------------------------------------------
class ToolManager {
public:
    static constexpr const char* kMetaProvider = "meta";
    static constexpr const char* kMetaTool = "list_mcp_tools";

    explicit ToolManager(const ClientOptions& options = {});
    ~ToolManager();

    ToolManager(const ToolManager&) = delete;
    ToolManager& operator=(const ToolManager&) = delete;

    // -- Registration --------------------------------------------------------

    /// Build a client for `config` and store it under `name`. Stdio providers
    /// need `process`. An existing registration is replaced without being
    /// closed; close it first if its cleanup matters.
    [[nodiscard]] Result<void, Error> Register(const std::string& name,
                                               const ProviderConfig& config,
                                               std::unique_ptr<IProcessPipe> process = nullptr);

    /// Store an already-constructed client under `name`.
    void Register(const std::string& name, std::unique_ptr<IProviderClient> client);

    [[nodiscard]] bool HasProvider(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> ProviderNames() const;

    // -- Catalog -------------------------------------------------------------

    /// Meta tool first, then every provider's tools. Providers are queried
    /// concurrently; a failing provider contributes nothing.
    [[nodiscard]] std::vector<ToolInfo> ListAllTools();

    static ToolInfo MetaToolInfo();

    // -- Invocation ----------------------------------------------------------

    [[nodiscard]] Result<ToolResult, Error> Execute(const std::string& provider_name,
                                                    const std::string& tool_name,
                                                    const nlohmann::json& arguments);

    [[nodiscard]] Result<nlohmann::json, Error> ListResources(const std::string& provider_name);

    [[nodiscard]] Result<nlohmann::json, Error> AccessResource(const std::string& provider_name,
                                                               const std::string& uri);

    /// Drained diagnostic lines of one provider; empty when unknown.
    [[nodiscard]] std::vector<std::string> GetStderrMessages(const std::string& provider_name);

    // -- Lifecycle -----------------------------------------------------------

    /// Wait for every provider concurrently. Providers that do not become
    /// ready are closed and removed; their names are returned.
    std::vector<std::string> WaitUntilReadyAll(std::chrono::milliseconds timeout);

    void CloseAll();

private:
    std::shared_ptr<IProviderClient> Find(const std::string& name) const;
    std::vector<std::pair<std::string, std::shared_ptr<IProviderClient>>> Snapshot() const;
    Error UnknownProviderError(const std::string& operation,
                               const std::string& provider_name) const;

    ClientOptions options_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<IProviderClient>> clients_;
};

} // namespace mcp_bridge
