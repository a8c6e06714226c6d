#pragma once

#include <mcp_bridge/core/types.hpp>
#include <mcp_bridge/mcp/i_provider_client.hpp>
#include <mcp_bridge/transport/i_http_client.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// HttpProviderClient: provider reached over plain HTTP request/response.
//
// Wire surface (relative to the URL's base path):
//   GET  /tools                  -> [ToolInfo] or {"tools": [...]}
//   GET  /resources              -> [...] or {"resources": [...]}
//   POST /tools/{name}/execute   body: arguments object
//   GET  /resources/{uri}        uri percent-encoded
//
// Non-2xx responses become errors carrying the HTTP status.
// ---------------------------------------------------------------------------
class HttpProviderClient : public IProviderClient {
public:
    HttpProviderClient(std::string name,
                       ServerUrl url,
                       std::unique_ptr<IHttpClient> http,
                       const ClientOptions& options = {});

    ~HttpProviderClient() override;

    [[nodiscard]] const std::string& Name() const override { return name_; }

    [[nodiscard]] Result<std::vector<ToolInfo>, Error> ListTools() override;
    [[nodiscard]] Result<nlohmann::json, Error> ListResources() override;

    [[nodiscard]] Result<nlohmann::json, Error> ExecuteTool(
        const std::string& tool_name,
        const nlohmann::json& arguments) override;

    [[nodiscard]] Result<nlohmann::json, Error> AccessResource(
        const std::string& uri) override;

    [[nodiscard]] bool WaitUntilReady(std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::vector<std::string> GetStderrMessages() override { return {}; }

    void Close() override;

protected:
    [[nodiscard]] const ServerUrl& Url() const noexcept { return url_; }
    [[nodiscard]] IHttpClient& Http() noexcept { return *http_; }
    [[nodiscard]] bool IsClosed() const noexcept { return closed_; }

    /// Log prefix component ("http" or "sse").
    [[nodiscard]] virtual const char* Component() const { return "http"; }

private:
    Result<nlohmann::json, Error> GetJson(const std::string& operation,
                                          const std::string& path,
                                          std::chrono::milliseconds timeout = kClientTimeout);
    Result<std::vector<ToolInfo>, Error> ListToolsWithin(std::chrono::milliseconds timeout);
    Result<nlohmann::json, Error> ParseBody(const std::string& operation,
                                            const std::string& path,
                                            const HttpResponse& response);

    std::string name_;
    ServerUrl url_;
    std::unique_ptr<IHttpClient> http_;
    ClientOptions options_;
    std::atomic<bool> closed_{false};
};

} // namespace mcp_bridge
