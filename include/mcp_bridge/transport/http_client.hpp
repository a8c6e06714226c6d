#pragma once

#include <mcp_bridge/core/types.hpp>
#include <mcp_bridge/transport/i_http_client.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// HttpClientOptions: timeouts for one provider service.
// ---------------------------------------------------------------------------
struct HttpClientOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{30};
    // An event stream idle for this long ends normally and is reopened.
    std::chrono::seconds stream_read_timeout{5};
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// HttpClient: concrete IHttpClient implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header. Requests and
// the event stream run on separate connections, so a long-lived stream does
// not block tool calls; each connection is guarded by its own mutex.
// ---------------------------------------------------------------------------
class HttpClient : public IHttpClient {
public:
    explicit HttpClient(const ServerUrl& url, const HttpClientOptions& options = {});

    ~HttpClient() override;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {},
        std::chrono::milliseconds timeout = kClientTimeout) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<int, Error> OpenEventStream(
        std::string_view path,
        const StreamChunkHandler& on_chunk) override;

    void Cancel() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_bridge
