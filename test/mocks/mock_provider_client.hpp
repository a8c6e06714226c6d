#pragma once

#include <mcp_bridge/mcp/i_provider_client.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mcp_bridge {
namespace testing {

// ---------------------------------------------------------------------------
// MockProviderClient: scripted IProviderClient for registry and
// orchestration tests.
//
// Usage:
//   auto mock = std::make_unique<MockProviderClient>("brave");
//   mock->SetTools({{"brave", "brave_web_search", "Search", {}}});
//   mock->EnqueueExecute(Result<nlohmann::json, Error>::Ok({{"result", "hit"}}));
//   auto* observer = mock.get();
//   manager.Register("brave", std::move(mock));
//
// Execute responses are consumed FIFO; an empty queue is a Transport error.
// ---------------------------------------------------------------------------

struct ExecuteCall {
    std::string tool_name;
    nlohmann::json arguments;
};

class MockProviderClient : public IProviderClient {
public:
    explicit MockProviderClient(std::string name) : name_(std::move(name)) {}

    // -- Scripting -----------------------------------------------------------

    void SetTools(std::vector<ToolInfo> tools) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_ = Result<std::vector<ToolInfo>, Error>::Ok(std::move(tools));
    }

    void FailListTools(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_ = Result<std::vector<ToolInfo>, Error>::Err(std::move(error));
    }

    void SetResources(nlohmann::json resources) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_ = std::move(resources);
    }

    void EnqueueExecute(Result<nlohmann::json, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        execute_responses_.push_back(std::move(response));
    }

    void EnqueueResource(Result<nlohmann::json, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        resource_responses_.push_back(std::move(response));
    }

    void SetReady(bool ready) { ready_ = ready; }

    void AddStderr(std::string line) {
        std::lock_guard<std::mutex> lock(mutex_);
        stderr_.push_back(std::move(line));
    }

    // -- Inspection ----------------------------------------------------------

    [[nodiscard]] std::vector<ExecuteCall> ExecuteCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return execute_calls_;
    }

    [[nodiscard]] std::vector<std::string> AccessedUris() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accessed_uris_;
    }

    [[nodiscard]] int CloseCount() const { return close_count_; }

    // -- IProviderClient implementation ---------------------------------------

    const std::string& Name() const override { return name_; }

    Result<std::vector<ToolInfo>, Error> ListTools() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return tools_;
    }

    Result<nlohmann::json, Error> ListResources() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return Result<nlohmann::json, Error>::Ok(resources_);
    }

    Result<nlohmann::json, Error> ExecuteTool(const std::string& tool_name,
                                              const nlohmann::json& arguments) override {
        std::lock_guard<std::mutex> lock(mutex_);
        execute_calls_.push_back({tool_name, arguments});
        return Dequeue(execute_responses_, "ExecuteTool");
    }

    Result<nlohmann::json, Error> AccessResource(const std::string& uri) override {
        std::lock_guard<std::mutex> lock(mutex_);
        accessed_uris_.push_back(uri);
        return Dequeue(resource_responses_, "AccessResource");
    }

    bool WaitUntilReady(std::chrono::milliseconds /*timeout*/) override {
        return ready_;
    }

    std::vector<std::string> GetStderrMessages() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> drained(stderr_.begin(), stderr_.end());
        stderr_.clear();
        return drained;
    }

    void Close() override { ++close_count_; }

private:
    Result<nlohmann::json, Error> Dequeue(std::deque<Result<nlohmann::json, Error>>& queue,
                                          const std::string& operation) {
        if (queue.empty()) {
            return Result<nlohmann::json, Error>::Err(Error{
                operation, name_, "MockProviderClient: no responses enqueued",
                ErrorCategory::Transport});
        }
        auto response = std::move(queue.front());
        queue.pop_front();
        return response;
    }

    std::string name_;
    mutable std::mutex mutex_;
    Result<std::vector<ToolInfo>, Error> tools_ =
        Result<std::vector<ToolInfo>, Error>::Ok(std::vector<ToolInfo>{});
    nlohmann::json resources_ = nlohmann::json::array();
    std::deque<Result<nlohmann::json, Error>> execute_responses_;
    std::deque<Result<nlohmann::json, Error>> resource_responses_;
    std::deque<std::string> stderr_;
    std::vector<ExecuteCall> execute_calls_;
    std::vector<std::string> accessed_uris_;
    std::atomic<bool> ready_{true};
    std::atomic<int> close_count_{0};
};

} // namespace testing
} // namespace mcp_bridge
