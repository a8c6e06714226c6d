#include <mcp_bridge/transport/http_client.hpp>
#include <mcp_bridge/core/log.hpp>

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>

namespace mcp_bridge {

namespace {

Error MakeTransportError(const std::string& operation,
                         const std::string& endpoint,
                         httplib::Error error) {
    auto category = ErrorCategory::Transport;
    if (error == httplib::Error::ConnectionTimeout ||
        error == httplib::Error::Read) {
        category = ErrorCategory::Timeout;
    }
    return Error{operation, endpoint,
                 "HTTP request failed: " + httplib::to_string(error), category};
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

httplib::Headers ToHttplibHeaders(const HttpHeaders& hdrs) {
    httplib::Headers result;
    result.emplace("Accept", "application/json");
    for (const auto& [key, value] : hdrs) {
        result.emplace(key, value);
    }
    return result;
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" || lower_key == "cookie" ||
           lower_key == "x-api-key";
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        LogDebug("http", "  > " + k + ": " + (IsSensitiveHeader(k) ? "<redacted>" : v));
    }
}

void LogResponse(int status, const std::string& body) {
    LogDebug("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

std::unique_ptr<httplib::Client> MakeClient(const ServerUrl& url,
                                            const HttpClientOptions& opts,
                                            std::chrono::seconds read_timeout) {
    auto client = std::make_unique<httplib::Client>(url.Origin());
    client->set_connection_timeout(opts.connect_timeout);
    client->set_read_timeout(read_timeout);
    client->set_keep_alive(true);
    if (url.UseHttps() && opts.disable_tls_verify) {
        client->enable_server_certificate_verification(false);
    }
    return client;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib clients.
// ---------------------------------------------------------------------------
struct HttpClient::Impl {
    std::string origin;
    HttpClientOptions options;
    std::mutex request_mutex;
    std::unique_ptr<httplib::Client> client;
    std::mutex stream_mutex;
    std::unique_ptr<httplib::Client> stream_client;
    std::atomic<bool> cancelled{false};

    Impl(const ServerUrl& url, const HttpClientOptions& opts)
        : origin(url.Origin()), options(opts) {
        client = MakeClient(url, opts, opts.read_timeout);
        // A Cancel() that lands before the stream connects has no socket to
        // shut down; the bounded read timeout still ends that stream.
        stream_client = MakeClient(url, opts, opts.stream_read_timeout);
    }

    Result<HttpResponse, Error> DoGet(std::string_view path,
                                      const HttpHeaders& extra_headers,
                                      std::chrono::milliseconds timeout) {
        auto hdrs = ToHttplibHeaders(extra_headers);
        LogDebug("http", "GET " + origin + std::string(path));
        LogRequestHeaders(hdrs);
        std::lock_guard<std::mutex> lock(request_mutex);
        const bool bounded = timeout > std::chrono::milliseconds::zero() &&
                             timeout < options.read_timeout;
        if (bounded) {
            client->set_connection_timeout(std::min<std::chrono::milliseconds>(
                timeout, options.connect_timeout));
            client->set_read_timeout(timeout);
        }
        auto res = client->Get(std::string(path), hdrs);
        if (bounded) {
            client->set_connection_timeout(options.connect_timeout);
            client->set_read_timeout(options.read_timeout);
        }
        if (!res) {
            return Result<HttpResponse, Error>::Err(
                MakeTransportError("Get", std::string(path), res.error()));
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }

    Result<HttpResponse, Error> DoPost(std::string_view path,
                                       std::string_view body,
                                       std::string_view content_type,
                                       const HttpHeaders& extra_headers) {
        auto hdrs = ToHttplibHeaders(extra_headers);
        LogDebug("http", "POST " + origin + std::string(path));
        LogRequestHeaders(hdrs);
        std::lock_guard<std::mutex> lock(request_mutex);
        auto res = client->Post(std::string(path), hdrs,
                                std::string(body), std::string(content_type));
        if (!res) {
            return Result<HttpResponse, Error>::Err(
                MakeTransportError("Post", std::string(path), res.error()));
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }

    Result<int, Error> DoStream(std::string_view path,
                                const StreamChunkHandler& on_chunk) {
        httplib::Headers hdrs;
        hdrs.emplace("Accept", "text/event-stream");
        hdrs.emplace("Cache-Control", "no-cache");
        LogDebug("http", "GET " + origin + std::string(path) + " (stream)");

        std::lock_guard<std::mutex> lock(stream_mutex);
        if (cancelled) {
            return Result<int, Error>::Ok(0);
        }
        auto res = stream_client->Get(
            std::string(path), hdrs,
            [&](const char* data, size_t length) {
                return on_chunk(std::string_view(data, length));
            });
        if (!res) {
            // A receiver that returned false or a stop() from Cancel() both
            // surface as Canceled; that is a normal end of the stream.
            if (res.error() == httplib::Error::Canceled) {
                return Result<int, Error>::Ok(0);
            }
            if (res.error() == httplib::Error::Read) {
                LogDebug("http", "stream " + std::string(path) + " idle for " +
                         std::to_string(options.stream_read_timeout.count()) +
                         "s, ending it");
                return Result<int, Error>::Ok(0);
            }
            return Result<int, Error>::Err(
                MakeTransportError("OpenEventStream", std::string(path), res.error()));
        }
        return Result<int, Error>::Ok(res->status);
    }
};

// ---------------------------------------------------------------------------
// HttpClient
// ---------------------------------------------------------------------------
HttpClient::HttpClient(const ServerUrl& url, const HttpClientOptions& options)
    : impl_(std::make_unique<Impl>(url, options)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse, Error> HttpClient::Get(std::string_view path,
                                            const HttpHeaders& headers,
                                            std::chrono::milliseconds timeout) {
    return impl_->DoGet(path, headers, timeout);
}

Result<HttpResponse, Error> HttpClient::Post(std::string_view path,
                                             std::string_view body,
                                             std::string_view content_type,
                                             const HttpHeaders& headers) {
    return impl_->DoPost(path, body, content_type, headers);
}

Result<int, Error> HttpClient::OpenEventStream(std::string_view path,
                                               const StreamChunkHandler& on_chunk) {
    return impl_->DoStream(path, on_chunk);
}

void HttpClient::Cancel() {
    // stop() is safe to call while another thread is inside a request.
    impl_->cancelled = true;
    impl_->stream_client->stop();
}

} // namespace mcp_bridge
