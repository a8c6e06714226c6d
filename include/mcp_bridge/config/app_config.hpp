#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_bridge {

// How a provider is reached. "stdio" spawns `command`; "http" and "sse"
// connect to `url`.
struct ProviderConfig {
    std::string type = "stdio";
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string url;
    std::string events_path = "/events";
};

struct AppConfig {
    std::map<std::string, ProviderConfig> providers;
    int request_timeout_seconds = 30;
    int ready_timeout_seconds = 60;
    int max_iterations = 3;
    std::size_t max_tool_output = 2000;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
};

// What the command line asked for, besides configuration overrides.
struct CliCommand {
    std::string name;           // "tools", "call", "resources", "read"
    std::string provider;
    std::string tool;
    std::string uri;
    std::string arguments_json = "{}";
};

struct CliInvocation {
    AppConfig overrides;
    std::optional<std::string> config_path;
    CliCommand command;
    bool show_version = false;
};

} // namespace mcp_bridge
