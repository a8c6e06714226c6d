#include <mcp_bridge/mcp/http_provider_client.hpp>

#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/url.hpp>

#include <algorithm>
#include <thread>

namespace mcp_bridge {

HttpProviderClient::HttpProviderClient(std::string name,
                                       ServerUrl url,
                                       std::unique_ptr<IHttpClient> http,
                                       const ClientOptions& options)
    : name_(std::move(name)),
      url_(std::move(url)),
      http_(std::move(http)),
      options_(options) {}

HttpProviderClient::~HttpProviderClient() = default;

Result<nlohmann::json, Error> HttpProviderClient::ParseBody(
    const std::string& operation,
    const std::string& path,
    const HttpResponse& response) {
    using R = Result<nlohmann::json, Error>;
    if (response.status_code < 200 || response.status_code >= 300) {
        return R::Err(Error::FromHttpStatus(operation, path, response.status_code,
                                            response.body));
    }
    if (response.body.empty()) {
        return R::Ok(nlohmann::json());
    }
    auto json = nlohmann::json::parse(response.body, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        // Plain-text answers are passed through as a string.
        return R::Ok(nlohmann::json(response.body));
    }
    return R::Ok(std::move(json));
}

Result<nlohmann::json, Error> HttpProviderClient::GetJson(const std::string& operation,
                                                          const std::string& path,
                                                          std::chrono::milliseconds timeout) {
    if (closed_) {
        return Result<nlohmann::json, Error>::Err(
            Error{operation, name_, "Client is closed", ErrorCategory::Transport});
    }
    auto response = http_->Get(path, {}, timeout);
    if (response.IsErr()) {
        return Result<nlohmann::json, Error>::Err(response.Error());
    }
    return ParseBody(operation, path, response.Value());
}

Result<std::vector<ToolInfo>, Error> HttpProviderClient::ListTools() {
    return ListToolsWithin(kClientTimeout);
}

Result<std::vector<ToolInfo>, Error> HttpProviderClient::ListToolsWithin(
    std::chrono::milliseconds timeout) {
    auto listing = GetJson("ListTools", JoinUrlPath(url_.BasePath(), "/tools"), timeout);
    if (listing.IsErr()) {
        return Result<std::vector<ToolInfo>, Error>::Err(listing.Error());
    }
    return ParseToolCatalog(name_, listing.Value());
}

Result<nlohmann::json, Error> HttpProviderClient::ListResources() {
    auto listing = GetJson("ListResources", JoinUrlPath(url_.BasePath(), "/resources"));
    if (listing.IsErr()) {
        return listing;
    }
    return ParseResourceList(name_, listing.Value());
}

Result<nlohmann::json, Error> HttpProviderClient::ExecuteTool(
    const std::string& tool_name,
    const nlohmann::json& arguments) {
    if (closed_) {
        return Result<nlohmann::json, Error>::Err(
            Error{"ExecuteTool", name_, "Client is closed", ErrorCategory::Transport});
    }
    auto path = JoinUrlPath(url_.BasePath(), "/tools/" + UrlEncode(tool_name) + "/execute");
    LogDebug(Component(), name_ + ": POST " + path);
    auto response = http_->Post(path, arguments.dump(), "application/json");
    if (response.IsErr()) {
        return Result<nlohmann::json, Error>::Err(response.Error());
    }
    return ParseBody("ExecuteTool", path, response.Value());
}

Result<nlohmann::json, Error> HttpProviderClient::AccessResource(const std::string& uri) {
    return GetJson("AccessResource",
                   JoinUrlPath(url_.BasePath(), "/resources/" + UrlEncode(uri)));
}

bool HttpProviderClient::WaitUntilReady(std::chrono::milliseconds timeout) {
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + timeout;
    for (;;) {
        // One slow attempt must not outlast the deadline.
        auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
        auto tools = ListToolsWithin(std::max(left, milliseconds(1)));
        if (tools.IsOk()) {
            LogInfo(Component(), name_ + ": ready at " + url_.Value() + " (" +
                    std::to_string(tools.Value().size()) + " tool(s))");
            return true;
        }
        if (closed_) {
            return false;
        }
        LogDebug(Component(), name_ + ": not ready yet: " + tools.Error().ToString());
        if (std::chrono::steady_clock::now() + options_.ready_poll_interval >= deadline) {
            LogWarn(Component(), name_ + ": not ready within " +
                    std::to_string(timeout.count()) + "ms");
            return false;
        }
        std::this_thread::sleep_for(options_.ready_poll_interval);
    }
}

void HttpProviderClient::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    LogDebug(Component(), name_ + ": closed");
}

} // namespace mcp_bridge
