#include <mcp_bridge/cli/bridge_commands.hpp>

#include <mcp_bridge/core/log.hpp>

#include <chrono>

namespace mcp_bridge {

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    return joined;
}

std::string StringField(const nlohmann::json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return "";
}

void LogDiagnostics(ToolManager& tools, const std::string& provider) {
    for (const auto& line : tools.GetStderrMessages(provider)) {
        LogInfo("cli", provider + " stderr: " + line);
    }
}

} // anonymous namespace

OrchestratorOptions MakeOrchestratorOptions(const AppConfig& config) {
    OrchestratorOptions options;
    options.max_iterations = config.max_iterations;
    options.max_tool_output = config.max_tool_output;
    return options;
}

std::vector<std::string> ConnectProviders(const AppConfig& config,
                                          ToolManager& tools,
                                          const OutputFormatter& formatter,
                                          const ProcessSpawner& spawn) {
    std::vector<std::string> degraded;

    for (const auto& [name, provider] : config.providers) {
        std::unique_ptr<IProcessPipe> process;
        if (provider.type == "stdio") {
            auto spawned = spawn(name, provider);
            if (spawned.IsErr()) {
                formatter.PrintWarning("Provider '" + name + "' failed to start: " +
                                       spawned.Error().message);
                degraded.push_back(name);
                continue;
            }
            process = std::move(spawned).Value();
        }

        auto registered = tools.Register(name, provider, std::move(process));
        if (registered.IsErr()) {
            formatter.PrintWarning("Provider '" + name + "' not registered: " +
                                   registered.Error().message);
            degraded.push_back(name);
        }
    }

    auto not_ready = tools.WaitUntilReadyAll(
        std::chrono::seconds(config.ready_timeout_seconds));
    if (!not_ready.empty()) {
        formatter.PrintWarning("Provider(s) not ready after " +
                               std::to_string(config.ready_timeout_seconds) +
                               "s and left out: " + JoinNames(not_ready));
        degraded.insert(degraded.end(), not_ready.begin(), not_ready.end());
    }

    LogInfo("cli", std::to_string(tools.ProviderNames().size()) + " provider(s) ready");
    return degraded;
}

int RunToolsCommand(ToolManager& tools, const OutputFormatter& formatter) {
    auto catalog = tools.ListAllTools();

    if (formatter.IsJsonMode()) {
        auto array = nlohmann::json::array();
        for (const auto& tool : catalog) {
            array.push_back({{"provider", tool.provider_name},
                             {"tool", tool.tool_name},
                             {"description", tool.description},
                             {"input_schema", tool.input_schema}});
        }
        formatter.PrintJson(array);
        return kExitSuccess;
    }

    std::vector<std::vector<std::string>> rows;
    rows.reserve(catalog.size());
    for (const auto& tool : catalog) {
        rows.push_back({tool.provider_name, tool.tool_name, tool.description});
    }
    formatter.PrintTable({"Provider", "Tool", "Description"}, rows);
    return kExitSuccess;
}

int RunCallCommand(ToolManager& tools, const CliCommand& command,
                   const OutputFormatter& formatter) {
    auto arguments = nlohmann::json::parse(command.arguments_json, nullptr,
                                           /*allow_exceptions=*/false);
    if (arguments.is_discarded()) {
        Error error{"Call", command.provider + "/" + command.tool,
                    "--args is not valid JSON: " + command.arguments_json,
                    ErrorCategory::Config};
        formatter.PrintError(error);
        return error.ExitCode();
    }

    auto result = tools.Execute(command.provider, command.tool, arguments);
    if (result.IsErr()) {
        formatter.PrintError(result.Error());
        return result.Error().ExitCode();
    }

    LogDiagnostics(tools, command.provider);

    const auto& tool_result = result.Value();
    if (tool_result.IsError()) {
        formatter.PrintToolFailure(*tool_result.error);
        return kExitToolFailed;
    }
    formatter.PrintToolOutput(tool_result.payload);
    return kExitSuccess;
}

int RunResourcesCommand(ToolManager& tools, const CliCommand& command,
                        const OutputFormatter& formatter) {
    auto result = tools.ListResources(command.provider);
    if (result.IsErr()) {
        formatter.PrintError(result.Error());
        return result.Error().ExitCode();
    }
    const auto& resources = result.Value();

    if (formatter.IsJsonMode()) {
        formatter.PrintJson(resources);
        return kExitSuccess;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& resource : resources) {
        rows.push_back({StringField(resource, "uri"),
                        StringField(resource, "name"),
                        StringField(resource, "mimeType")});
    }
    formatter.PrintTable({"URI", "Name", "MIME type"}, rows);
    return kExitSuccess;
}

int RunReadCommand(ToolManager& tools, const CliCommand& command,
                   const OutputFormatter& formatter) {
    auto result = tools.AccessResource(command.provider, command.uri);
    if (result.IsErr()) {
        formatter.PrintError(result.Error());
        return result.Error().ExitCode();
    }
    const auto& content = result.Value();

    // resources/read answers {"contents": [{"uri", "text" | "blob"}]}.
    if (!formatter.IsJsonMode() && content.is_object() && content.contains("contents") &&
        content["contents"].is_array()) {
        for (const auto& part : content["contents"]) {
            auto text = StringField(part, "text");
            if (!text.empty()) {
                formatter.PrintToolOutput(text);
            } else {
                formatter.PrintJson(part);
            }
        }
        return kExitSuccess;
    }
    formatter.PrintToolOutput(content);
    return kExitSuccess;
}

int RunCommand(ToolManager& tools, const CliCommand& command,
               const OutputFormatter& formatter) {
    if (command.name == "tools") {
        return RunToolsCommand(tools, formatter);
    }
    if (command.name == "call") {
        return RunCallCommand(tools, command, formatter);
    }
    if (command.name == "resources") {
        return RunResourcesCommand(tools, command, formatter);
    }
    if (command.name == "read") {
        return RunReadCommand(tools, command, formatter);
    }
    formatter.PrintError(Error{"Dispatch", command.name,
                               "Unknown command '" + command.name + "'",
                               ErrorCategory::Internal});
    return kExitInternal;
}

} // namespace mcp_bridge
