#include <mcp_bridge/registry/tool_manager.hpp>

#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/mcp/provider_factory.hpp>
#include <mcp_bridge/registry/tool_normalization.hpp>

#include <future>

namespace mcp_bridge {

ToolManager::ToolManager(const ClientOptions& options) : options_(options) {}

ToolManager::~ToolManager() {
    CloseAll();
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------
Result<void, Error> ToolManager::Register(const std::string& name,
                                         const ProviderConfig& config,
                                         std::unique_ptr<IProcessPipe> process) {
    auto client = CreateProviderClient(name, config, std::move(process), options_);
    if (client.IsErr()) {
        LogError("registry", "Cannot register provider '" + name + "': " +
                 client.Error().ToString());
        return Result<void, Error>::Err(std::move(client).Error());
    }
    Register(name, std::move(client).Value());
    return Result<void, Error>::Ok();
}

void ToolManager::Register(const std::string& name,
                           std::unique_ptr<IProviderClient> client) {
    // Not closed here. Dropped after the lock unless a caller still holds it.
    std::shared_ptr<IProviderClient> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(name);
        if (it != clients_.end()) {
            LogInfo("registry", "Provider '" + name + "' is already registered, replacing it");
            replaced = std::move(it->second);
            it->second = std::move(client);
        } else {
            clients_.emplace(name, std::move(client));
        }
    }
    LogInfo("registry", "Provider '" + name + "' registered");
}

bool ToolManager::HasProvider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.count(name) > 0;
}

std::vector<std::string> ToolManager::ProviderNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& [name, client] : clients_) {
        names.push_back(name);
    }
    return names;
}

std::shared_ptr<IProviderClient> ToolManager::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    return it == clients_.end() ? nullptr : it->second;
}

std::vector<std::pair<std::string, std::shared_ptr<IProviderClient>>>
ToolManager::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {clients_.begin(), clients_.end()};
}

Error ToolManager::UnknownProviderError(const std::string& operation,
                                        const std::string& provider_name) const {
    return Error{operation, provider_name,
                 "Provider '" + provider_name + "' is not registered",
                 ErrorCategory::UnknownProvider};
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------
ToolInfo ToolManager::MetaToolInfo() {
    return ToolInfo{kMetaProvider, kMetaTool,
                    "Lists every available tool of every connected provider.",
                    nlohmann::json::object()};
}

std::vector<ToolInfo> ToolManager::ListAllTools() {
    auto clients = Snapshot();

    std::vector<std::future<Result<std::vector<ToolInfo>, Error>>> listings;
    listings.reserve(clients.size());
    for (const auto& [name, client] : clients) {
        listings.push_back(std::async(std::launch::async, [client = client] {
            return client->ListTools();
        }));
    }

    std::vector<ToolInfo> tools{MetaToolInfo()};
    for (size_t i = 0; i < clients.size(); ++i) {
        auto listing = listings[i].get();
        const auto& name = clients[i].first;
        if (listing.IsErr()) {
            LogError("registry", "Failed to list tools of '" + name + "': " +
                     listing.Error().ToString());
            continue;
        }
        for (auto& tool : std::move(listing).Value()) {
            tool.provider_name = name;
            tools.push_back(std::move(tool));
        }
    }
    return tools;
}

// ---------------------------------------------------------------------------
// Invocation
// ---------------------------------------------------------------------------
Result<ToolResult, Error> ToolManager::Execute(const std::string& provider_name,
                                               const std::string& tool_name,
                                               const nlohmann::json& arguments) {
    using R = Result<ToolResult, Error>;
    LogInfo("registry", "Executing " + provider_name + "/" + tool_name +
            " with arguments " + arguments.dump());

    if (provider_name == kMetaProvider) {
        if (tool_name != kMetaTool) {
            return R::Ok(ToolResult::Failure("Unknown meta tool '" + tool_name + "'"));
        }
        return R::Ok(ToolResult::Success(FormatToolCatalog(ListAllTools())));
    }

    auto client = Find(provider_name);
    if (!client) {
        return R::Err(UnknownProviderError("Execute", provider_name));
    }

    auto coerced = CoerceArguments(arguments);
    if (coerced.IsErr()) {
        LogWarn("registry", coerced.Error());
        return R::Ok(ToolResult::Failure(coerced.Error()));
    }
    auto args = std::move(coerced).Value();

    auto fixed = ApplyArgumentFixups(provider_name, tool_name, args);
    if (fixed.IsErr()) {
        return R::Err(fixed.Error());
    }

    auto raw = client->ExecuteTool(tool_name, args);
    if (raw.IsErr()) {
        LogError("registry", "Tool " + provider_name + "/" + tool_name + " failed: " +
                 raw.Error().ToString());
        return R::Ok(ToolResult::Failure(raw.Error().ToString()));
    }
    LogDebug("registry", "Raw result of " + tool_name + ": " + raw.Value().dump());

    auto result = NormalizeToolResult(raw.Value());
    if (result.IsError()) {
        LogWarn("registry", "Tool " + provider_name + "/" + tool_name +
                " reported an error: " + *result.error);
    }
    return R::Ok(std::move(result));
}

Result<nlohmann::json, Error> ToolManager::ListResources(const std::string& provider_name) {
    auto client = Find(provider_name);
    if (!client) {
        return Result<nlohmann::json, Error>::Err(
            UnknownProviderError("ListResources", provider_name));
    }
    return client->ListResources();
}

Result<nlohmann::json, Error> ToolManager::AccessResource(const std::string& provider_name,
                                                          const std::string& uri) {
    auto client = Find(provider_name);
    if (!client) {
        return Result<nlohmann::json, Error>::Err(
            UnknownProviderError("AccessResource", provider_name));
    }
    return client->AccessResource(uri);
}

std::vector<std::string> ToolManager::GetStderrMessages(const std::string& provider_name) {
    auto client = Find(provider_name);
    if (!client) {
        return {};
    }
    return client->GetStderrMessages();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
std::vector<std::string> ToolManager::WaitUntilReadyAll(std::chrono::milliseconds timeout) {
    auto clients = Snapshot();

    std::vector<std::future<bool>> checks;
    checks.reserve(clients.size());
    for (const auto& [name, client] : clients) {
        checks.push_back(std::async(std::launch::async, [client = client, timeout] {
            return client->WaitUntilReady(timeout);
        }));
    }

    std::vector<std::string> degraded;
    for (size_t i = 0; i < clients.size(); ++i) {
        if (checks[i].get()) {
            continue;
        }
        const auto& [name, client] = clients[i];
        LogWarn("registry", "Provider '" + name + "' did not become ready, removing it");
        degraded.push_back(name);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = clients_.find(name);
            if (it != clients_.end() && it->second == client) {
                clients_.erase(it);
            }
        }
        client->Close();
    }
    return degraded;
}

void ToolManager::CloseAll() {
    std::map<std::string, std::shared_ptr<IProviderClient>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients.swap(clients_);
    }
    for (auto& [name, client] : clients) {
        client->Close();
        LogInfo("registry", "Provider '" + name + "' closed");
    }
}

} // namespace mcp_bridge
