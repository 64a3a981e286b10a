#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/process/child_process.hpp>
#include <mcp_relay/process/server_process.hpp>
#include <mcp_relay/routing/tool_registry.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// LifecycleManager — the process table. Owns one ServerProcess per
// descriptor, keyed by server id, and keeps the tool registry in step with
// their Ready transitions.
// ---------------------------------------------------------------------------
class LifecycleManager {
public:
    LifecycleManager(std::vector<ServerDescriptor> descriptors,
                     IProcessLauncher& launcher,
                     ToolRegistry& registry);
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    void Start();
    void Stop();

    /// Clear a server's restart count and leave Fatal. Unknown ids are
    /// InvalidParams.
    [[nodiscard]] Result<void, Error> ResetServer(const std::string& server_id);

    /// Status of every server, in configuration order.
    [[nodiscard]] std::vector<ServerStatus> Snapshot() const;

    /// nullptr when no such server.
    [[nodiscard]] ServerProcess* Find(const std::string& server_id) const;

    /// Servers in configuration order.
    [[nodiscard]] std::vector<ServerProcess*> Servers() const;

private:
    ToolRegistry& registry_;
    std::vector<std::unique_ptr<ServerProcess>> servers_;
    std::map<std::string, ServerProcess*> by_id_;
};

} // namespace mcp_relay
