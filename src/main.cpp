#include <mcp_bridge/cli/bridge_commands.hpp>
#include <mcp_bridge/cli/output_formatter.hpp>
#include <mcp_bridge/config/config_loader.hpp>
#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/terminal.hpp>
#include <mcp_bridge/core/version.hpp>
#include <mcp_bridge/mcp/provider_factory.hpp>
#include <mcp_bridge/registry/tool_manager.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

namespace {

using namespace mcp_bridge;

// Console (colored, or JSON lines in --json mode) plus the optional log file.
void InitLogging(const AppConfig& config) {
    const auto level = LogLevelFromFlags(config.verbose, config.quiet);
    std::unique_ptr<ILogSink> console;
    if (config.json_output) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        console = std::make_unique<ColorConsoleSink>(
            ColorEnabledFor(StdStream::Err));
    }

    if (config.log_file.has_value()) {
        auto file = std::make_unique<FileSink>(*config.log_file);
        if (!file->IsOpen()) {
            std::cerr << "Warning: cannot open log file " << *config.log_file << "\n";
            InitGlobalLogger(std::move(console), level);
            return;
        }
        InitGlobalLogger(std::make_unique<TeeSink>(std::move(console), std::move(file)),
                         level);
        return;
    }
    InitGlobalLogger(std::move(console), level);
}

ClientOptions MakeClientOptions(const AppConfig& config) {
    ClientOptions options;
    options.request_timeout = std::chrono::seconds(config.request_timeout_seconds);
    return options;
}

// CLI flags, then the YAML file, merged, env references resolved, validated.
Result<AppConfig, Error> BuildConfig(const CliInvocation& invocation) {
    AppConfig config = invocation.overrides;
    if (invocation.config_path.has_value()) {
        auto yaml = LoadFromYaml(*invocation.config_path);
        if (yaml.IsErr()) {
            return yaml;
        }
        config = MergeConfigs(yaml.Value(), invocation.overrides);
    }

    auto resolved = ResolveEnvReferences(std::move(config));
    if (resolved.IsErr()) {
        return resolved;
    }
    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return resolved;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    // A provider that exits early must not kill us through a write to its stdin.
    std::signal(SIGPIPE, SIG_IGN);

    auto invocation = LoadFromCli(argc, argv);
    if (invocation.IsErr()) {
        OutputFormatter(false).PrintError(invocation.Error());
        return invocation.Error().ExitCode();
    }

    if (invocation.Value().show_version) {
        std::cout << "mcp-bridge " << kVersion << "\n";
        return kExitSuccess;
    }

    const bool json_mode = invocation.Value().overrides.json_output;
    auto config = BuildConfig(invocation.Value());
    if (config.IsErr()) {
        OutputFormatter(json_mode).PrintError(config.Error());
        return config.Error().ExitCode();
    }

    InitLogging(config.Value());
    OutputFormatter formatter(config.Value().json_output,
                              ColorEnabledFor(StdStream::Out));

    ToolManager tools(MakeClientOptions(config.Value()));
    ConnectProviders(config.Value(), tools, formatter, SpawnProviderProcess);

    int exit_code = RunCommand(tools, invocation.Value().command, formatter);
    tools.CloseAll();
    return exit_code;
}
