#pragma once

#include <mcp_relay/process/child_process.hpp>

#include <mutex>
#include <string>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// PosixChildProcess — a child started with posix_spawnp, stdin/stdout on
// pipes, stderr inherited. The child leads its own process group so signals
// also reach anything it spawned (npx, uv).
// ---------------------------------------------------------------------------
class PosixChildProcess : public IChildProcess {
public:
    PosixChildProcess(int pid, int stdin_fd, int stdout_fd);
    ~PosixChildProcess() override;

    PosixChildProcess(const PosixChildProcess&) = delete;
    PosixChildProcess& operator=(const PosixChildProcess&) = delete;

    Result<void, Error> WriteLine(std::string_view line) override;
    std::optional<std::string> ReadLine() override;
    void CloseStdin() override;
    bool IsAlive() override;
    bool WaitForExit(std::chrono::milliseconds timeout) override;
    void Terminate() override;
    void Kill() override;
    int Pid() const override { return pid_; }

private:
    bool Reap(bool block);
    void Signal(int signal);

    const int pid_;
    int stdin_fd_;
    int stdout_fd_;
    std::string read_buffer_;

    std::mutex wait_mutex_;
    bool exited_ = false;
    int exit_status_ = 0;
};

class PosixProcessLauncher : public IProcessLauncher {
public:
    Result<std::unique_ptr<IChildProcess>, Error> Launch(
        const ServerDescriptor& descriptor) override;
};

} // namespace mcp_relay
