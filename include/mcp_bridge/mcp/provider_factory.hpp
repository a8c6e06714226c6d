#pragma once

#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/mcp/i_provider_client.hpp>
#include <mcp_bridge/transport/i_process_pipe.hpp>

#include <memory>
#include <string>

namespace mcp_bridge {

/// Build the client variant implied by `config.type`:
///   "stdio" -> StdioProviderClient over `process` (required)
///   "sse"   -> SseProviderClient on `config.url`
///   other   -> HttpProviderClient on `config.url`
/// Missing process or invalid URL is a Config error.
Result<std::unique_ptr<IProviderClient>, Error> CreateProviderClient(
    const std::string& name,
    const ProviderConfig& config,
    std::unique_ptr<IProcessPipe> process,
    const ClientOptions& options = {});

/// Start the child process for a stdio provider.
Result<std::unique_ptr<IProcessPipe>, Error> SpawnProviderProcess(
    const std::string& name,
    const ProviderConfig& config);

} // namespace mcp_bridge
