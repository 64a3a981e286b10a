#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/process/server_descriptor.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// IChildProcess — a spawned tool server speaking newline-delimited JSON-RPC
// on its stdin/stdout.
//
// Threading: one thread writes (WriteLine, CloseStdin), one thread reads
// (ReadLine). Liveness and signal methods may be called from any thread.
// ---------------------------------------------------------------------------
class IChildProcess {
public:
    virtual ~IChildProcess() = default;

    /// Write one line; a trailing newline is appended.
    [[nodiscard]] virtual Result<void, Error> WriteLine(std::string_view line) = 0;

    /// Block until a full line is available. nullopt on EOF or read error.
    [[nodiscard]] virtual std::optional<std::string> ReadLine() = 0;

    /// Close the child's stdin so a well-behaved server exits on EOF.
    virtual void CloseStdin() = 0;

    [[nodiscard]] virtual bool IsAlive() = 0;

    /// Wait up to `timeout` for exit. True once the process has exited.
    [[nodiscard]] virtual bool WaitForExit(std::chrono::milliseconds timeout) = 0;

    virtual void Terminate() = 0;  // SIGTERM
    virtual void Kill() = 0;       // SIGKILL

    [[nodiscard]] virtual int Pid() const = 0;
};

// Spawns children for descriptors. Tests substitute a scripted launcher.
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<IChildProcess>, Error> Launch(
        const ServerDescriptor& descriptor) = 0;
};

} // namespace mcp_relay
