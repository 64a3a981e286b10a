#include <mcp_relay/process/lifecycle_manager.hpp>

#include <mcp_relay/core/log.hpp>

namespace mcp_relay {

LifecycleManager::LifecycleManager(std::vector<ServerDescriptor> descriptors,
                                   IProcessLauncher& launcher,
                                   ToolRegistry& registry)
    : registry_(registry) {
    ServerProcessHooks hooks;
    hooks.on_ready = [this](const std::string& id, const std::vector<ToolInfo>& tools) {
        registry_.RegisterOwner(id, tools);
    };
    hooks.on_withdrawn = [this](const std::string& id) {
        auto removed = registry_.RemoveOwner(id);
        LogDebug("lifecycle", "Withdrew " + std::to_string(removed) + " tool(s) of '" +
                                  id + "'");
    };

    servers_.reserve(descriptors.size());
    for (auto& descriptor : descriptors) {
        auto server = std::make_unique<ServerProcess>(std::move(descriptor), launcher, hooks);
        by_id_[server->Descriptor().id] = server.get();
        servers_.push_back(std::move(server));
    }
}

LifecycleManager::~LifecycleManager() {
    Stop();
}

void LifecycleManager::Start() {
    LogInfo("lifecycle", "Starting " + std::to_string(servers_.size()) + " tool server(s)");
    for (auto& server : servers_) {
        server->Start();
    }
}

void LifecycleManager::Stop() {
    for (auto& server : servers_) {
        server->Stop();
    }
}

Result<void, Error> LifecycleManager::ResetServer(const std::string& server_id) {
    auto* server = Find(server_id);
    if (server == nullptr) {
        return Result<void, Error>::Err(MakeError(ErrorCategory::InvalidParams,
                                                  "ResetServer", "Unknown server",
                                                  server_id));
    }
    server->Reset();
    return Result<void, Error>::Ok();
}

std::vector<ServerStatus> LifecycleManager::Snapshot() const {
    std::vector<ServerStatus> out;
    out.reserve(servers_.size());
    for (const auto& server : servers_) {
        out.push_back(server->Status());
    }
    return out;
}

ServerProcess* LifecycleManager::Find(const std::string& server_id) const {
    auto it = by_id_.find(server_id);
    return it == by_id_.end() ? nullptr : it->second;
}

std::vector<ServerProcess*> LifecycleManager::Servers() const {
    std::vector<ServerProcess*> out;
    out.reserve(servers_.size());
    for (const auto& server : servers_) {
        out.push_back(server.get());
    }
    return out;
}

} // namespace mcp_relay
