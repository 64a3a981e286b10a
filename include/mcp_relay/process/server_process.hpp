#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/process/child_process.hpp>
#include <mcp_relay/process/server_descriptor.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_relay {

enum class ServerState {
    Stopped,
    Starting,
    Ready,
    Unhealthy,
    Restarting,
    Fatal,
};

[[nodiscard]] const char* ServerStateName(ServerState state);

// One tool as advertised by its server's tools/list.
struct ToolInfo {
    std::string name;
    nlohmann::json definition;  // the full tool object (name, description, inputSchema)
};

// Result payload of a JSON-RPC call, or the reason it failed.
using CallResult = Result<nlohmann::json, Error>;

// ---------------------------------------------------------------------------
// PendingCall — one request admitted to a server's dispatch queue. Owned by
// the queue until written, then by the in-flight table until its response,
// deadline or the process's failure. Completed exactly once.
// ---------------------------------------------------------------------------
struct PendingCall {
    int64_t internal_id = 0;
    std::string session;
    std::string method;
    nlohmann::json params;
    std::chrono::steady_clock::time_point deadline;
    std::chrono::steady_clock::time_point sent_at;  // when written to stdin
    bool internal = false;      // handshake or health probe
    bool notification = false;  // written without an id, completes on write
    bool cancelled = false;     // waiter already failed; discard the response
    bool completed = false;
    std::promise<CallResult> promise;
};

struct ServerStatus {
    std::string id;
    std::string name;
    ServerState state = ServerState::Stopped;
    int restart_count = 0;
    std::string last_error;
    uint64_t request_count = 0;
    std::size_t tool_count = 0;
    std::optional<int> pid;
};

// Registry side effects of state transitions. Both run with the process
// lock held: tools are withdrawn before the state leaves Ready and offered
// only after it entered Ready.
struct ServerProcessHooks {
    std::function<void(const std::string& server_id,
                       const std::vector<ToolInfo>& tools)> on_ready;
    std::function<void(const std::string& server_id)> on_withdrawn;
};

// ---------------------------------------------------------------------------
// ServerProcess — one supervised tool server.
//
// Threads: the supervisor drives the lifecycle and health probes; the drain
// thread is the only writer to the child's stdin and expires deadlines; a
// reader thread per spawned child is the only reader of its stdout.
// ---------------------------------------------------------------------------
class ServerProcess {
public:
    ServerProcess(ServerDescriptor descriptor,
                  IProcessLauncher& launcher,
                  ServerProcessHooks hooks = {});
    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    /// Start the supervisor. A disabled descriptor stays Stopped.
    void Start();

    /// Graceful shutdown: fail pending calls, close stdin, SIGTERM, SIGKILL.
    void Stop();

    /// Admit a call. Rejected immediately with ServerUnavailable unless
    /// Ready, or with ServerBusy when the queue is at capacity.
    [[nodiscard]] Result<std::future<CallResult>, Error> Submit(
        const std::string& session,
        const std::string& method,
        const nlohmann::json& params);

    /// Fail this session's queued and in-flight calls with Cancelled.
    /// Returns the number of calls cancelled.
    std::size_t CancelSession(const std::string& session);

    /// Leave Fatal (or clear the restart count) and start again.
    void Reset();

    [[nodiscard]] ServerStatus Status() const;
    [[nodiscard]] ServerState State() const;
    [[nodiscard]] const ServerDescriptor& Descriptor() const { return descriptor_; }

    /// Block until the state satisfies `predicate` or the timeout passes.
    [[nodiscard]] bool WaitForState(const std::function<bool(ServerState)>& predicate,
                                    std::chrono::milliseconds timeout) const;

private:
    using CallPtr = std::shared_ptr<PendingCall>;
    using Lock = std::unique_lock<std::mutex>;

    // -- Supervisor ---------------------------------------------------------
    void SupervisorLoop();
    bool StartAndHandshake();
    void MonitorWhileHealthy();
    bool Probe();
    void HandleFailure(Lock& lock);
    void ShutdownChild(bool graceful);

    // -- Dispatch -----------------------------------------------------------
    void DrainLoop();
    void ReaderLoop(std::shared_ptr<IChildProcess> child, uint64_t generation);
    void HandleLine(const std::string& line);

    Result<std::future<CallResult>, Error> SubmitLocked(
        const std::string& session, const std::string& method,
        const nlohmann::json& params, bool internal,
        std::chrono::milliseconds timeout, bool notification = false);
    CallResult CallInternal(const std::string& method, const nlohmann::json& params,
                            std::chrono::milliseconds timeout,
                            bool notification = false);
    Result<std::vector<ToolInfo>, Error> FetchTools(
        std::chrono::steady_clock::time_point deadline);

    void SetState(ServerState next);
    void LeaveReadyLocked(ServerState next);
    std::vector<CallPtr> TakeAllLocked();
    std::vector<CallPtr> TakeExpiredLocked(std::chrono::steady_clock::time_point now);
    static void Complete(std::vector<CallPtr>& calls, const Error& error);
    static void Complete(const CallPtr& call, CallResult result);
    bool MarkCompletedLocked(const CallPtr& call);
    Error UnavailableError(const std::string& message) const;

    const ServerDescriptor descriptor_;
    IProcessLauncher& launcher_;
    const ServerProcessHooks hooks_;

    mutable std::mutex mutex_;
    mutable std::condition_variable state_cv_;   // supervisor + WaitForState
    std::condition_variable drain_cv_;

    ServerState state_ = ServerState::Stopped;
    int restart_count_ = 0;
    std::string last_error_;
    uint64_t request_count_ = 0;
    std::vector<ToolInfo> tools_;

    std::shared_ptr<IChildProcess> child_;
    uint64_t generation_ = 0;
    bool child_eof_ = false;
    // Last line read from the child's stdout. A call that expires with no
    // output since it was written marks the child stalled.
    std::chrono::steady_clock::time_point last_output_;
    bool stalled_ = false;
    bool stopping_ = false;
    bool reset_requested_ = false;
    bool started_ = false;

    int64_t next_id_ = 1;
    std::deque<CallPtr> queue_;
    std::map<int64_t, CallPtr> in_flight_;

    std::thread supervisor_;
    std::thread drain_;
    std::thread reader_;
};

} // namespace mcp_relay
