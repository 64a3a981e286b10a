#pragma once

#include <mcp_relay/process/server_process.hpp>

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_relay {

struct ToolOwner {
    std::string server_id;
    nlohmann::json definition;
};

// ---------------------------------------------------------------------------
// ToolRegistry — live map tool name -> owning Ready server.
//
// A name belongs to the first server that registered it; later claims are
// rejected until the owner withdraws. Listing order is registration order.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    /// Register a server's tools. Returns the names rejected because
    /// another server already owns them.
    std::vector<std::string> RegisterOwner(const std::string& server_id,
                                           const std::vector<ToolInfo>& tools);

    /// Remove every tool owned by the server. Returns how many were removed.
    std::size_t RemoveOwner(const std::string& server_id);

    [[nodiscard]] std::optional<ToolOwner> Lookup(const std::string& tool_name) const;

    /// Tool definitions in registration order.
    [[nodiscard]] std::vector<nlohmann::json> List() const;

    [[nodiscard]] std::size_t Size() const;

private:
    struct Entry {
        uint64_t sequence;
        ToolOwner owner;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> tools_;
    uint64_t next_sequence_ = 0;
};

} // namespace mcp_relay
