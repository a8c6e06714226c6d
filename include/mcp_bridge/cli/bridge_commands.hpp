#pragma once

#include <mcp_bridge/cli/output_formatter.hpp>
#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/registry/tool_manager.hpp>
#include <mcp_bridge/transport/i_process_pipe.hpp>
#include <mcp_bridge/workflow/tool_orchestrator.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mcp_bridge {

// Exit codes of the mcp-bridge binary. Failures use Error::ExitCode().
constexpr int kExitSuccess = 0;
constexpr int kExitToolFailed = 6;
constexpr int kExitInternal = 99;

using ProcessSpawner = std::function<Result<std::unique_ptr<IProcessPipe>, Error>(
    const std::string& name, const ProviderConfig& config)>;

// Register every configured provider with `tools`, spawning stdio
// providers through `spawn`, then wait for readiness. Providers that fail
// to start or do not become ready are reported as warnings and left out;
// their names are returned.
std::vector<std::string> ConnectProviders(const AppConfig& config,
                                          ToolManager& tools,
                                          const OutputFormatter& formatter,
                                          const ProcessSpawner& spawn);

// Loop limits for a ToolOrchestrator driven by this configuration.
OrchestratorOptions MakeOrchestratorOptions(const AppConfig& config);

// -- Subcommands -------------------------------------------------------------
// Each prints its result through `formatter` and returns the exit code.

int RunToolsCommand(ToolManager& tools, const OutputFormatter& formatter);

int RunCallCommand(ToolManager& tools, const CliCommand& command,
                   const OutputFormatter& formatter);

int RunResourcesCommand(ToolManager& tools, const CliCommand& command,
                        const OutputFormatter& formatter);

int RunReadCommand(ToolManager& tools, const CliCommand& command,
                   const OutputFormatter& formatter);

// Dispatch on command.name.
int RunCommand(ToolManager& tools, const CliCommand& command,
               const OutputFormatter& formatter);

} // namespace mcp_bridge
