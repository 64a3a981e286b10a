#include <mcp_relay/routing/tool_registry.hpp>

#include <mcp_relay/core/log.hpp>

#include <algorithm>
#include <mutex>

namespace mcp_relay {

std::vector<std::string> ToolRegistry::RegisterOwner(const std::string& server_id,
                                                     const std::vector<ToolInfo>& tools) {
    std::vector<std::string> rejected;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& tool : tools) {
        auto it = tools_.find(tool.name);
        if (it != tools_.end()) {
            if (it->second.owner.server_id != server_id) {
                rejected.push_back(tool.name);
            }
            continue;
        }
        tools_.emplace(tool.name, Entry{next_sequence_++, ToolOwner{server_id, tool.definition}});
    }
    lock.unlock();

    for (const auto& name : rejected) {
        LogWarn("registry", "Tool '" + name + "' from '" + server_id +
                                "' rejected: already owned by another server");
    }
    return rejected;
}

std::size_t ToolRegistry::RemoveOwner(const std::string& server_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = tools_.begin(); it != tools_.end();) {
        if (it->second.owner.server_id == server_id) {
            it = tools_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::optional<ToolOwner> ToolRegistry::Lookup(const std::string& tool_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(tool_name);
    if (it == tools_.end()) return std::nullopt;
    return it->second.owner;
}

std::vector<nlohmann::json> ToolRegistry::List() const {
    std::vector<const Entry*> entries;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    entries.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        entries.push_back(&entry);
    }
    std::sort(entries.begin(), entries.end(),
              [](const Entry* a, const Entry* b) { return a->sequence < b->sequence; });

    std::vector<nlohmann::json> out;
    out.reserve(entries.size());
    for (const auto* entry : entries) {
        out.push_back(entry->owner.definition);
    }
    return out;
}

std::size_t ToolRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.size();
}

} // namespace mcp_relay
