#pragma once

#include <mcp_relay/process/server_descriptor.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_relay {

struct CredentialConfig {
    std::string token;
    std::optional<std::string> token_env;  // env var name to read token from
    std::string principal;
    std::vector<std::string> permissions;
};

struct PolicyRuleConfig {
    std::string principal = "*";
    std::string action = "*";
    std::string resource = "*";
    std::string effect = "allow";
    std::map<std::string, std::string> when;  // argument name -> required value
};

struct ServerOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8444;
    int threads = 8;
    std::string log_level = "info";
    std::optional<std::string> log_file;
    bool json_logs = false;
};

struct ControlPlaneConfig {
    ServerOptions server;
    std::vector<CredentialConfig> credentials;
    std::vector<PolicyRuleConfig> policy;
    bool has_policy = false;  // false: no policy section was configured
    std::vector<ServerDescriptor> mcp_servers;
};

struct BridgeConfig {
    std::string control_plane_url = "http://localhost:8444";
    std::string auth_token;
    std::chrono::seconds timeout{30};
    int retry_attempts = 3;
    std::chrono::milliseconds reconnect_base{500};
    std::chrono::milliseconds reconnect_cap{10000};
    std::size_t workers = 1;  // >1 forwards concurrently, arrival order not kept
    std::string log_level = "info";
    std::optional<std::string> log_file;
};

} // namespace mcp_relay
