#include <mcp_relay/process/posix_process.hpp>

#include <mcp_relay/core/log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <map>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_relay {

namespace {

Error SpawnError(const ServerDescriptor& descriptor, const std::string& message) {
    return MakeError(ErrorCategory::ServerUnavailable, "Launch", message, descriptor.id);
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Parent environment with the descriptor's variables laid over it.
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& extra) {
    std::map<std::string, std::string> merged;
    if (environ != nullptr) {
        for (char** e = environ; *e != nullptr; ++e) {
            std::string entry(*e);
            auto eq = entry.find('=');
            if (eq == std::string::npos) continue;
            merged[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : extra) {
        merged[key] = value;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> PointerArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// PosixChildProcess
// ---------------------------------------------------------------------------

PosixChildProcess::PosixChildProcess(int pid, int stdin_fd, int stdout_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd) {}

PosixChildProcess::~PosixChildProcess() {
    CloseFd(stdin_fd_);
    if (!Reap(false)) {
        Signal(SIGKILL);
        Reap(true);
    }
    CloseFd(stdout_fd_);
}

Result<void, Error> PosixChildProcess::WriteLine(std::string_view line) {
    if (stdin_fd_ < 0) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::ServerUnavailable, "WriteLine", "stdin already closed"));
    }
    std::string data(line);
    data.push_back('\n');

    std::size_t written = 0;
    while (written < data.size()) {
        auto n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void, Error>::Err(MakeError(
                ErrorCategory::ServerUnavailable, "WriteLine",
                std::string("write to child stdin failed: ") + std::strerror(errno)));
        }
        written += static_cast<std::size_t>(n);
    }
    return Result<void, Error>::Ok();
}

std::optional<std::string> PosixChildProcess::ReadLine() {
    while (true) {
        auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            auto line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            return line;
        }

        std::array<char, 4096> buf{};
        auto n = ::read(stdout_fd_, buf.data(), buf.size());
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return std::nullopt;
        read_buffer_.append(buf.data(), static_cast<std::size_t>(n));
    }
}

void PosixChildProcess::CloseStdin() {
    CloseFd(stdin_fd_);
}

bool PosixChildProcess::Reap(bool block) {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (exited_) return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        exited_ = true;
        exit_status_ = status;
        return true;
    }
    return false;
}

bool PosixChildProcess::IsAlive() {
    return !Reap(false);
}

bool PosixChildProcess::WaitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!Reap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

void PosixChildProcess::Signal(int signal) {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (exited_) return;
    }
    // Negative pid: the whole process group the child leads.
    if (::kill(-pid_, signal) != 0) {
        ::kill(pid_, signal);
    }
}

void PosixChildProcess::Terminate() {
    Signal(SIGTERM);
}

void PosixChildProcess::Kill() {
    Signal(SIGKILL);
}

// ---------------------------------------------------------------------------
// PosixProcessLauncher
// ---------------------------------------------------------------------------

Result<std::unique_ptr<IChildProcess>, Error> PosixProcessLauncher::Launch(
    const ServerDescriptor& descriptor) {
    using R = Result<std::unique_ptr<IChildProcess>, Error>;

    auto argv_strings = descriptor.Argv();
    if (argv_strings.empty()) {
        return R::Err(SpawnError(descriptor, "empty command"));
    }

    // O_CLOEXEC keeps our pipe ends out of sibling tool servers; dup2 in
    // the file actions clears it on the child's stdin/stdout.
    int stdin_pipe[2];
    int stdout_pipe[2];
    if (::pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        return R::Err(SpawnError(descriptor, "failed to create stdin pipe"));
    }
    if (::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        return R::Err(SpawnError(descriptor, "failed to create stdout pipe"));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdout_pipe[1], STDOUT_FILENO);
    if (descriptor.working_dir.has_value()) {
        posix_spawn_file_actions_addchdir_np(&actions, descriptor.working_dir->c_str());
    }

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    auto env_strings = BuildEnvironment(descriptor.env);
    auto argv = PointerArray(argv_strings);
    auto envp = PointerArray(env_strings);

    pid_t pid = -1;
    const int status = ::posix_spawnp(&pid, argv_strings.front().c_str(), &actions,
                                      &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);

    if (status != 0) {
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        return R::Err(SpawnError(descriptor, "failed to spawn '" + argv_strings.front() +
                                                 "': " + std::strerror(status)));
    }

    LogInfo("process", "Started '" + descriptor.id + "' (" +
                           ServerTypeName(descriptor.type) + ", pid " +
                           std::to_string(pid) + ")");
    return R::Ok(std::make_unique<PosixChildProcess>(pid, stdin_pipe[1], stdout_pipe[0]));
}

} // namespace mcp_relay
