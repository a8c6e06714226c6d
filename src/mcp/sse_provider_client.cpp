#include <mcp_bridge/mcp/sse_provider_client.hpp>
#include <mcp_bridge/mcp/sse_parser.hpp>

#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/url.hpp>

namespace mcp_bridge {

SseProviderClient::SseProviderClient(std::string name,
                                     ServerUrl url,
                                     std::unique_ptr<IHttpClient> http,
                                     std::string events_path,
                                     const ClientOptions& options)
    : HttpProviderClient(std::move(name), std::move(url), std::move(http), options),
      events_path_(JoinUrlPath(Url().BasePath(), events_path)),
      reconnect_delay_(options.ready_poll_interval) {
    listener_ = std::thread([this] { ListenLoop(); });
}

SseProviderClient::~SseProviderClient() {
    Close();
}

void SseProviderClient::ListenLoop() {
    SseParser parser;
    while (!stop_) {
        LogDebug("sse", Name() + ": opening event stream " + events_path_);
        auto result = Http().OpenEventStream(
            events_path_, [&](std::string_view chunk) {
                for (const auto& event : parser.Feed(chunk)) {
                    ++events_received_;
                    LogInfo("sse", Name() + ": event '" + event.event + "'" +
                            (event.id.empty() ? "" : " id=" + event.id) +
                            ": " + event.data);
                }
                return !stop_;
            });
        if (stop_) {
            break;
        }
        if (result.IsErr()) {
            LogWarn("sse", Name() + ": event stream failed: " + result.Error().ToString());
        } else if (result.Value() != 0 &&
                   (result.Value() < 200 || result.Value() >= 300)) {
            LogWarn("sse", Name() + ": event stream answered HTTP " +
                    std::to_string(result.Value()));
        } else {
            LogDebug("sse", Name() + ": event stream ended");
        }

        auto delay = parser.RetryMs()
                         ? std::chrono::milliseconds(*parser.RetryMs())
                         : reconnect_delay_;
        std::unique_lock<std::mutex> lock(stop_mutex_);
        stop_cv_.wait_for(lock, delay, [this] { return stop_.load(); });
    }
    LogDebug("sse", Name() + ": listener stopped");
}

void SseProviderClient::Close() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_ = true;
    }
    stop_cv_.notify_all();
    if (listener_.joinable()) {
        Http().Cancel();
        listener_.join();
    }
    HttpProviderClient::Close();
}

} // namespace mcp_bridge
