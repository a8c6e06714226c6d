#pragma once

#include <mcp_bridge/mcp/http_provider_client.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// SseProviderClient: HTTP provider with a server-sent event stream.
//
// Tool and resource calls use the same request/response surface as
// HttpProviderClient. A background listener keeps a GET on `events_path`
// open and logs each pushed event; events are not correlated with calls.
// The listener reconnects after the stream ends, waiting the server's
// "retry:" hint or the readiness poll interval.
// ---------------------------------------------------------------------------
class SseProviderClient : public HttpProviderClient {
public:
    SseProviderClient(std::string name,
                      ServerUrl url,
                      std::unique_ptr<IHttpClient> http,
                      std::string events_path = "/events",
                      const ClientOptions& options = {});

    ~SseProviderClient() override;

    void Close() override;

    [[nodiscard]] std::size_t EventsReceived() const noexcept { return events_received_; }

protected:
    [[nodiscard]] const char* Component() const override { return "sse"; }

private:
    void ListenLoop();

    std::string events_path_;
    std::chrono::milliseconds reconnect_delay_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::atomic<bool> stop_{false};
    std::atomic<std::size_t> events_received_{0};
    std::thread listener_;
};

} // namespace mcp_bridge
