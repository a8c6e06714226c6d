#include <mcp_bridge/mcp/provider_factory.hpp>

#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/types.hpp>
#include <mcp_bridge/mcp/http_provider_client.hpp>
#include <mcp_bridge/mcp/sse_provider_client.hpp>
#include <mcp_bridge/mcp/stdio_provider_client.hpp>
#include <mcp_bridge/transport/child_process.hpp>
#include <mcp_bridge/transport/http_client.hpp>

namespace mcp_bridge {

namespace {

Error MakeFactoryError(const std::string& name, const std::string& message) {
    return Error{"CreateProviderClient", name, message, ErrorCategory::Config};
}

} // anonymous namespace

Result<std::unique_ptr<IProviderClient>, Error> CreateProviderClient(
    const std::string& name,
    const ProviderConfig& config,
    std::unique_ptr<IProcessPipe> process,
    const ClientOptions& options) {
    using R = Result<std::unique_ptr<IProviderClient>, Error>;

    if (config.type == "stdio") {
        if (!process) {
            return R::Err(MakeFactoryError(name, "stdio provider requires a process"));
        }
        return R::Ok(std::make_unique<StdioProviderClient>(name, std::move(process),
                                                           options));
    }

    if (config.url.empty()) {
        return R::Err(MakeFactoryError(name, config.type + " provider requires a url"));
    }
    auto url = ServerUrl::Create(config.url);
    if (url.IsErr()) {
        return R::Err(MakeFactoryError(name, url.Error()));
    }

    HttpClientOptions http_options;
    http_options.read_timeout = std::chrono::duration_cast<std::chrono::seconds>(
        options.request_timeout);
    if (http_options.read_timeout.count() <= 0) {
        http_options.read_timeout = std::chrono::seconds(1);
    }
    auto http = std::make_unique<HttpClient>(url.Value(), http_options);

    if (config.type == "sse") {
        return R::Ok(std::make_unique<SseProviderClient>(
            name, std::move(url).Value(), std::move(http), config.events_path, options));
    }
    if (config.type != "http") {
        LogWarn("registry", "Provider '" + name + "' has type '" + config.type +
                "', treating it as http");
    }
    return R::Ok(std::make_unique<HttpProviderClient>(
        name, std::move(url).Value(), std::move(http), options));
}

Result<std::unique_ptr<IProcessPipe>, Error> SpawnProviderProcess(
    const std::string& name,
    const ProviderConfig& config) {
    using R = Result<std::unique_ptr<IProcessPipe>, Error>;
    LogInfo("process", "Starting provider '" + name + "': " + config.command);
    auto child = ChildProcess::Spawn(config.command, config.args, config.env);
    if (child.IsErr()) {
        auto error = std::move(child).Error();
        error.endpoint = name;
        return R::Err(std::move(error));
    }
    return R::Ok(std::move(child).Value());
}

} // namespace mcp_bridge
