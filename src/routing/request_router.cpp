#include <mcp_relay/routing/request_router.hpp>

#include <mcp_relay/core/log.hpp>

#include <future>
#include <utility>
#include <vector>

namespace mcp_relay {

RequestRouter::RequestRouter(ToolRegistry& registry, LifecycleManager& lifecycle)
    : registry_(registry), lifecycle_(lifecycle) {}

CallResult RequestRouter::CallTool(const std::string& session,
                                   const std::string& name,
                                   const nlohmann::json& arguments) {
    auto owner = registry_.Lookup(name);
    if (!owner.has_value()) {
        return CallResult::Err(MakeError(ErrorCategory::NoOwner, "tools/call",
                                         "No server owns tool '" + name + "'", name));
    }
    auto* server = lifecycle_.Find(owner->server_id);
    if (server == nullptr) {
        return CallResult::Err(MakeError(ErrorCategory::NoOwner, "tools/call",
                                         "Owner of tool '" + name + "' is gone", name));
    }

    nlohmann::json params = {{"name", name}, {"arguments", arguments}};
    auto submitted = server->Submit(session, "tools/call", params);
    if (submitted.IsErr()) {
        return CallResult::Err(std::move(submitted).Error());
    }
    LogDebug("router", "tools/call '" + name + "' -> '" + owner->server_id + "'");
    return std::move(submitted).Value().get();
}

nlohmann::json RequestRouter::ListTools() const {
    return {{"tools", registry_.List()}};
}

nlohmann::json RequestRouter::ListResources(const std::string& session) {
    return FanOut(session, "resources/list", "resources");
}

nlohmann::json RequestRouter::ListPrompts(const std::string& session) {
    return FanOut(session, "prompts/list", "prompts");
}

std::size_t RequestRouter::CancelSession(const std::string& session) {
    std::size_t cancelled = 0;
    for (auto* server : lifecycle_.Servers()) {
        cancelled += server->CancelSession(session);
    }
    return cancelled;
}

nlohmann::json RequestRouter::FanOut(const std::string& session,
                                     const std::string& method,
                                     const std::string& key) {
    // Submit to every server first so the slow ones overlap.
    std::vector<std::pair<std::string, std::future<CallResult>>> pending;
    for (auto* server : lifecycle_.Servers()) {
        if (server->State() != ServerState::Ready) continue;
        const auto& id = server->Descriptor().id;
        auto submitted = server->Submit(session, method, nlohmann::json::object());
        if (submitted.IsErr()) {
            LogWarn("router", method + " skipped '" + id + "': " +
                                  submitted.Error().message);
            continue;
        }
        pending.emplace_back(id, std::move(submitted).Value());
    }

    nlohmann::json items = nlohmann::json::array();
    for (auto& [id, future] : pending) {
        auto result = future.get();
        if (result.IsErr()) {
            const auto& error = result.Error();
            if (error.category == ErrorCategory::ToolError &&
                error.tool_code == rpc_code::kMethodNotFound) {
                LogDebug("router", "'" + id + "' does not implement " + method);
            } else {
                LogWarn("router", method + " failed on '" + id + "': " + error.message);
            }
            continue;
        }
        const auto& payload = result.Value();
        auto list = payload.find(key);
        if (list == payload.end() || !list->is_array()) continue;
        for (const auto& item : *list) {
            items.push_back(item);
        }
    }
    return {{key, std::move(items)}};
}

} // namespace mcp_relay
