#include <mcp_bridge/config/config_loader.hpp>

#include <mcp_bridge/core/types.hpp>
#include <mcp_bridge/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace mcp_bridge {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", message, ErrorCategory::Config};
}

bool IsKnownProviderType(const std::string& type) {
    return type == "stdio" || type == "http" || type == "sse";
}

// Build a ProviderConfig from a YAML mapping.
Result<ProviderConfig, Error> ParseYamlProvider(const std::string& name,
                                                const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<ProviderConfig, Error>::Err(
            MakeConfigError("Provider '" + name + "' must be a mapping"));
    }

    ProviderConfig provider;
    if (node["type"]) {
        provider.type = node["type"].as<std::string>();
    } else if (node["url"] && !node["command"]) {
        provider.type = "http";
    }
    if (node["command"]) {
        provider.command = node["command"].as<std::string>();
    }
    if (node["args"]) {
        if (!node["args"].IsSequence()) {
            return Result<ProviderConfig, Error>::Err(
                MakeConfigError("Provider '" + name + "': 'args' must be a list"));
        }
        for (const auto& arg : node["args"]) {
            provider.args.push_back(arg.as<std::string>());
        }
    }
    if (node["env"]) {
        if (!node["env"].IsMap()) {
            return Result<ProviderConfig, Error>::Err(
                MakeConfigError("Provider '" + name + "': 'env' must be a mapping"));
        }
        for (const auto& kv : node["env"]) {
            provider.env[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (node["url"]) {
        provider.url = node["url"].as<std::string>();
    }
    if (node["events_path"]) {
        provider.events_path = node["events_path"].as<std::string>();
    }
    return Result<ProviderConfig, Error>::Ok(std::move(provider));
}

// Expand every ${NAME} in `value`.
Result<std::string, Error> ExpandReferences(const std::string& provider,
                                            const std::string& key,
                                            const std::string& value) {
    std::string out;
    size_t pos = 0;
    while (pos < value.size()) {
        auto open = value.find("${", pos);
        if (open == std::string::npos) {
            out += value.substr(pos);
            break;
        }
        auto close = value.find('}', open + 2);
        if (close == std::string::npos) {
            out += value.substr(pos);
            break;
        }
        out += value.substr(pos, open - pos);
        auto var = value.substr(open + 2, close - open - 2);
        const char* env_val = std::getenv(var.c_str());
        if (env_val == nullptr) {
            return Result<std::string, Error>::Err(MakeConfigError(
                "Environment variable '" + var + "' not set (referenced by " +
                provider + "." + key + ")"));
        }
        out += env_val;
        pos = close + 1;
    }
    return Result<std::string, Error>::Ok(std::move(out));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;

    try {
        // -- Providers --
        if (root["providers"]) {
            if (!root["providers"].IsMap()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("'providers' must be a mapping of name to provider"));
            }
            for (const auto& entry : root["providers"]) {
                auto name = entry.first.as<std::string>();
                auto name_result = ProviderName::Create(name);
                if (name_result.IsErr()) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Invalid provider name: " + name_result.Error()));
                }
                auto provider = ParseYamlProvider(name, entry.second);
                if (provider.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(provider).Error());
                }
                config.providers[name] = std::move(provider).Value();
            }
        }

        // -- Options --
        if (root["request_timeout"]) {
            config.request_timeout_seconds = root["request_timeout"].as<int>();
        }
        if (root["ready_timeout"]) {
            config.ready_timeout_seconds = root["ready_timeout"].as<int>();
        }
        if (root["max_iterations"]) {
            config.max_iterations = root["max_iterations"].as<int>();
        }
        if (root["max_tool_output"]) {
            config.max_tool_output = root["max_tool_output"].as<std::size_t>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-bridge", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--request-timeout")
        .help("Per-request timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--ready-timeout")
        .help("Provider readiness deadline in seconds")
        .scan<'i', int>();
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser tools_cmd("tools", kVersion, argparse::default_arguments::help);
    tools_cmd.add_description("List the tools of every configured provider");

    argparse::ArgumentParser call_cmd("call", kVersion, argparse::default_arguments::help);
    call_cmd.add_description("Execute one tool and print its result");
    call_cmd.add_argument("provider").help("Provider name");
    call_cmd.add_argument("tool").help("Tool name");
    call_cmd.add_argument("--args")
        .help("Tool arguments as a JSON object")
        .default_value(std::string("{}"));

    argparse::ArgumentParser resources_cmd("resources", kVersion,
                                           argparse::default_arguments::help);
    resources_cmd.add_description("List the resources of one provider");
    resources_cmd.add_argument("provider").help("Provider name");

    argparse::ArgumentParser read_cmd("read", kVersion, argparse::default_arguments::help);
    read_cmd.add_description("Read one resource");
    read_cmd.add_argument("provider").help("Provider name");
    read_cmd.add_argument("uri").help("Resource URI");

    program.add_subparser(tools_cmd);
    program.add_subparser(call_cmd);
    program.add_subparser(resources_cmd);
    program.add_subparser(read_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliInvocation, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliInvocation invocation;
    auto& config = invocation.overrides;

    if (auto val = program.present("--config")) {
        invocation.config_path = *val;
    }
    if (auto val = program.present<int>("--request-timeout")) {
        config.request_timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--ready-timeout")) {
        config.ready_timeout_seconds = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    invocation.show_version = program.get<bool>("--version");

    auto& command = invocation.command;
    if (program.is_subcommand_used(tools_cmd)) {
        command.name = "tools";
    } else if (program.is_subcommand_used(call_cmd)) {
        command.name = "call";
        command.provider = call_cmd.get<std::string>("provider");
        command.tool = call_cmd.get<std::string>("tool");
        command.arguments_json = call_cmd.get<std::string>("--args");
    } else if (program.is_subcommand_used(resources_cmd)) {
        command.name = "resources";
        command.provider = resources_cmd.get<std::string>("provider");
    } else if (program.is_subcommand_used(read_cmd)) {
        command.name = "read";
        command.provider = read_cmd.get<std::string>("provider");
        command.uri = read_cmd.get<std::string>("uri");
    } else if (!invocation.show_version) {
        return Result<CliInvocation, Error>::Err(MakeConfigError(
            "No command given (expected one of: tools, call, resources, read)"));
    }

    return Result<CliInvocation, Error>::Ok(std::move(invocation));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    for (const auto& [name, provider] : cli_overrides.providers) {
        merged.providers[name] = provider;
    }
    if (cli_overrides.request_timeout_seconds != defaults.request_timeout_seconds) {
        merged.request_timeout_seconds = cli_overrides.request_timeout_seconds;
    }
    if (cli_overrides.ready_timeout_seconds != defaults.ready_timeout_seconds) {
        merged.ready_timeout_seconds = cli_overrides.ready_timeout_seconds;
    }
    if (cli_overrides.max_iterations != defaults.max_iterations) {
        merged.max_iterations = cli_overrides.max_iterations;
    }
    if (cli_overrides.max_tool_output != defaults.max_tool_output) {
        merged.max_tool_output = cli_overrides.max_tool_output;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// ResolveEnvReferences
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveEnvReferences(AppConfig config) {
    for (auto& [name, provider] : config.providers) {
        for (auto& [key, value] : provider.env) {
            auto expanded = ExpandReferences(name, key, value);
            if (expanded.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(expanded).Error());
            }
            value = std::move(expanded).Value();
        }
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.providers.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("At least one provider must be configured"));
    }
    for (const auto& [name, provider] : config.providers) {
        if (!IsKnownProviderType(provider.type)) {
            return Result<void, Error>::Err(MakeConfigError(
                "Provider '" + name + "': unknown type '" + provider.type +
                "' (expected stdio, http or sse)"));
        }
        if (provider.type == "stdio") {
            if (provider.command.empty()) {
                return Result<void, Error>::Err(MakeConfigError(
                    "Provider '" + name + "': stdio providers require 'command'"));
            }
            continue;
        }
        if (provider.url.empty()) {
            return Result<void, Error>::Err(MakeConfigError(
                "Provider '" + name + "': " + provider.type +
                " providers require 'url'"));
        }
        auto url = ServerUrl::Create(provider.url);
        if (url.IsErr()) {
            return Result<void, Error>::Err(MakeConfigError(
                "Provider '" + name + "': " + url.Error()));
        }
    }
    if (config.request_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("request_timeout must be positive, got " +
                            std::to_string(config.request_timeout_seconds)));
    }
    if (config.ready_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("ready_timeout must be positive, got " +
                            std::to_string(config.ready_timeout_seconds)));
    }
    if (config.max_iterations < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("max_iterations must be at least 1, got " +
                            std::to_string(config.max_iterations)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_bridge
