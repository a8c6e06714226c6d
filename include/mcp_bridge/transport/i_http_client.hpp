#pragma once

#include <mcp_bridge/core/result.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// HttpHeaders: header name/value pairs. Names are case-sensitive in this
// representation; callers normalise as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

/// Request timeout meaning "use the client's configured read timeout".
constexpr std::chrono::milliseconds kClientTimeout{0};

/// Receives raw bytes of a streaming response. Return false to stop reading.
using StreamChunkHandler = std::function<bool(std::string_view chunk)>;

// ---------------------------------------------------------------------------
// IHttpClient: abstract HTTP client bound to one origin.
//
// The HTTP and SSE provider clients depend on this interface rather than on
// cpp-httplib, which enables offline testing via MockHttpClient.
//
// Paths are absolute request paths ("/api/tools"); the origin is fixed at
// construction. Non-2xx responses are returned as Ok(HttpResponse); only
// transport failures (refused, reset, timed out) are Err.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

    /// A non-zero `timeout` shorter than the client's own limits bounds
    /// both connecting and reading for this request only.
    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {},
        std::chrono::milliseconds timeout = kClientTimeout) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    /// GET `path` and feed the body to `on_chunk` as it arrives. Blocks until
    /// the server ends the stream, `on_chunk` returns false, Cancel() is
    /// called, or the stream stays idle past the stream read timeout. The
    /// last three return Ok(0). Otherwise returns the response status (the
    /// body is not retained).
    [[nodiscard]] virtual Result<int, Error> OpenEventStream(
        std::string_view path,
        const StreamChunkHandler& on_chunk) = 0;

    /// Abort an in-flight OpenEventStream from another thread.
    virtual void Cancel() = 0;

protected:
    IHttpClient() = default;
};

} // namespace mcp_bridge
