#pragma once

#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_bridge {

// Parse a YAML config file into an AppConfig. Provider names are validated.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments: global flags become AppConfig overrides, the
// subcommand and its positionals become a CliCommand.
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Replace ${NAME} references in provider env values with the parent
// environment's value. A reference to an unset variable is an error.
Result<AppConfig, Error> ResolveEnvReferences(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace mcp_bridge
