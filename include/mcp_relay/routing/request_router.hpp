#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/process/lifecycle_manager.hpp>
#include <mcp_relay/routing/tool_registry.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// RequestRouter — resolves a call to its owning server and waits for the
// outcome. Every failure comes back as an Error carrying its category.
// ---------------------------------------------------------------------------
class RequestRouter {
public:
    RequestRouter(ToolRegistry& registry, LifecycleManager& lifecycle);

    /// tools/call. NoOwner when no Ready server advertises `name`;
    /// ServerBusy / ServerUnavailable straight from the owner's queue.
    [[nodiscard]] CallResult CallTool(const std::string& session,
                                      const std::string& name,
                                      const nlohmann::json& arguments);

    /// {"tools": [...]} from the registry.
    [[nodiscard]] nlohmann::json ListTools() const;

    /// {"resources": [...]} gathered from every Ready server.
    [[nodiscard]] nlohmann::json ListResources(const std::string& session);

    /// {"prompts": [...]} gathered from every Ready server.
    [[nodiscard]] nlohmann::json ListPrompts(const std::string& session);

    /// Cancel a session's calls on every server.
    std::size_t CancelSession(const std::string& session);

private:
    nlohmann::json FanOut(const std::string& session, const std::string& method,
                          const std::string& key);

    ToolRegistry& registry_;
    LifecycleManager& lifecycle_;
};

} // namespace mcp_relay
