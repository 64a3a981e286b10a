#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_relay {

// How a tool server is launched. Only used for logging and validation; the
// command line is always given explicitly.
enum class ServerType {
    Python,
    Npx,
    Uv,
    Binary,
};

[[nodiscard]] std::optional<ServerType> ParseServerType(std::string_view name);
[[nodiscard]] const char* ServerTypeName(ServerType type);

// ---------------------------------------------------------------------------
// ServerDescriptor — static configuration of one backend tool server.
// Immutable once loaded; owned by the LifecycleManager.
// ---------------------------------------------------------------------------
struct ServerDescriptor {
    std::string id;
    std::string name;
    ServerType type = ServerType::Binary;
    std::vector<std::string> command;        // argv[0] plus fixed arguments
    std::vector<std::string> args;           // appended to command
    std::map<std::string, std::string> env;  // merged over the parent env
    std::optional<std::string> working_dir;
    bool enabled = true;
    bool restart_on_failure = true;

    std::chrono::milliseconds health_check_interval{10000};
    std::chrono::milliseconds startup_timeout{30000};
    int max_restart_attempts = 5;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{30000};

    // Admitted calls (queued + in flight) before ServerBusy.
    std::size_t queue_capacity = 16;
    // 1 = strict FIFO, one request outstanding on the pipe at a time.
    std::size_t max_in_flight = 1;
    std::chrono::milliseconds call_timeout{30000};

    /// Full argv: command followed by args.
    [[nodiscard]] std::vector<std::string> Argv() const {
        std::vector<std::string> argv = command;
        argv.insert(argv.end(), args.begin(), args.end());
        return argv;
    }
};

} // namespace mcp_relay
