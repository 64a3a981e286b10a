#include <mcp_relay/process/server_process.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/core/version.hpp>
#include <mcp_relay/process/backoff.hpp>
#include <mcp_relay/protocol/json_rpc.hpp>

#include <algorithm>

namespace mcp_relay {

namespace {

constexpr const char* kComponent = "process";

// Shutdown grace periods: after closing stdin, then after SIGTERM.
constexpr std::chrono::milliseconds kStdinGrace{2000};
constexpr std::chrono::milliseconds kTerminateGrace{5000};
constexpr std::chrono::milliseconds kKillWait{2000};

constexpr int kMaxToolPages = 100;

std::string Millis(std::chrono::milliseconds ms) {
    return std::to_string(ms.count()) + "ms";
}

// A tool server's error reply, passed through with its own code even when
// that code collides with one the relay uses.
Error ToolError(const nlohmann::json& error_object, const std::string& method,
                const std::string& server_id) {
    auto error = ErrorFromRpc(error_object, method, server_id);
    error.tool_code = error.JsonRpcCode();
    error.category = ErrorCategory::ToolError;
    return error;
}

} // anonymous namespace

const char* ServerStateName(ServerState state) {
    switch (state) {
        case ServerState::Stopped:    return "stopped";
        case ServerState::Starting:   return "starting";
        case ServerState::Ready:      return "ready";
        case ServerState::Unhealthy:  return "unhealthy";
        case ServerState::Restarting: return "restarting";
        case ServerState::Fatal:      return "fatal";
    }
    return "stopped";
}

ServerProcess::ServerProcess(ServerDescriptor descriptor,
                             IProcessLauncher& launcher,
                             ServerProcessHooks hooks)
    : descriptor_(std::move(descriptor)),
      launcher_(launcher),
      hooks_(std::move(hooks)) {}

ServerProcess::~ServerProcess() {
    Stop();
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

void ServerProcess::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) return;
    if (!descriptor_.enabled) {
        LogInfo(kComponent, "Server '" + descriptor_.id + "' is disabled, not starting");
        return;
    }
    started_ = true;
    stopping_ = false;
    drain_ = std::thread(&ServerProcess::DrainLoop, this);
    supervisor_ = std::thread(&ServerProcess::SupervisorLoop, this);
}

void ServerProcess::Stop() {
    std::vector<CallPtr> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_ || stopping_) return;
        stopping_ = true;
        if (state_ == ServerState::Ready && hooks_.on_withdrawn) {
            hooks_.on_withdrawn(descriptor_.id);
        }
        failed = TakeAllLocked();
    }
    state_cv_.notify_all();
    drain_cv_.notify_all();
    Complete(failed, UnavailableError("Server is shutting down"));

    if (supervisor_.joinable()) supervisor_.join();
    if (drain_.joinable()) drain_.join();
    ShutdownChild(true);

    std::lock_guard<std::mutex> lock(mutex_);
    SetState(ServerState::Stopped);
    started_ = false;
    LogInfo(kComponent, "Server '" + descriptor_.id + "' stopped");
}

Result<std::future<CallResult>, Error> ServerProcess::Submit(
    const std::string& session,
    const std::string& method,
    const nlohmann::json& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ServerState::Ready || child_eof_) {
        return Result<std::future<CallResult>, Error>::Err(UnavailableError(
            std::string("Server is ") + ServerStateName(state_)));
    }

    auto admitted = std::count_if(queue_.begin(), queue_.end(),
                                  [](const CallPtr& c) { return !c->internal; });
    admitted += std::count_if(in_flight_.begin(), in_flight_.end(),
                              [](const auto& entry) { return !entry.second->internal; });
    if (static_cast<std::size_t>(admitted) >= descriptor_.queue_capacity) {
        return Result<std::future<CallResult>, Error>::Err(MakeError(
            ErrorCategory::ServerBusy, method,
            "Server busy: " + std::to_string(admitted) + " calls pending",
            descriptor_.id));
    }

    ++request_count_;
    return SubmitLocked(session, method, params, false, descriptor_.call_timeout);
}

std::size_t ServerProcess::CancelSession(const std::string& session) {
    std::vector<CallPtr> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = queue_.begin(); it != queue_.end();) {
            if ((*it)->session == session && !(*it)->internal) {
                if (MarkCompletedLocked(*it)) cancelled.push_back(*it);
                it = queue_.erase(it);
            } else {
                ++it;
            }
        }
        // In-flight calls keep their pipe slot until the response arrives
        // (and is discarded) or the deadline passes.
        for (auto& [id, call] : in_flight_) {
            if (call->session != session || call->internal) continue;
            call->cancelled = true;
            if (MarkCompletedLocked(call)) cancelled.push_back(call);
        }
    }
    drain_cv_.notify_one();

    Complete(cancelled, MakeError(ErrorCategory::Cancelled, "CancelSession",
                                  "Request cancelled: session closed", descriptor_.id));
    if (!cancelled.empty()) {
        LogInfo(kComponent, "Cancelled " + std::to_string(cancelled.size()) +
                                " call(s) of session '" + session + "' on '" +
                                descriptor_.id + "'");
    }
    return cancelled.size();
}

void ServerProcess::Reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        restart_count_ = 0;
        if (state_ == ServerState::Fatal) {
            reset_requested_ = true;
        }
    }
    LogInfo(kComponent, "Operator reset of '" + descriptor_.id + "'");
    state_cv_.notify_all();
}

ServerStatus ServerProcess::Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ServerStatus status;
    status.id = descriptor_.id;
    status.name = descriptor_.name;
    status.state = state_;
    status.restart_count = restart_count_;
    status.last_error = last_error_;
    status.request_count = request_count_;
    status.tool_count = state_ == ServerState::Ready ? tools_.size() : 0;
    if (child_) status.pid = child_->Pid();
    return status;
}

ServerState ServerProcess::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ServerProcess::WaitForState(const std::function<bool(ServerState)>& predicate,
                                 std::chrono::milliseconds timeout) const {
    Lock lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [&] { return predicate(state_); });
}

// ---------------------------------------------------------------------------
// Supervisor
// ---------------------------------------------------------------------------

void ServerProcess::SupervisorLoop() {
    Lock lock(mutex_);
    while (!stopping_) {
        if (state_ == ServerState::Fatal) {
            state_cv_.wait(lock, [&] { return stopping_ || reset_requested_; });
            if (stopping_) break;
            reset_requested_ = false;
            restart_count_ = 0;
            last_error_.clear();
            SetState(ServerState::Stopped);
            continue;
        }

        lock.unlock();
        if (StartAndHandshake()) {
            MonitorWhileHealthy();
        }
        lock.lock();
        if (stopping_) break;
        HandleFailure(lock);
    }
}

bool ServerProcess::StartAndHandshake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        SetState(ServerState::Starting);
    }

    auto launched = launcher_.Launch(descriptor_);
    if (launched.IsErr()) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = launched.Error().message;
        LogError(kComponent, launched.Error().ToString());
        return false;
    }
    std::shared_ptr<IChildProcess> child = std::move(launched).Value();

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        child_ = child;
        child_eof_ = false;
        stalled_ = false;
        last_output_ = std::chrono::steady_clock::now();
        generation = ++generation_;
    }
    reader_ = std::thread(&ServerProcess::ReaderLoop, this, child, generation);
    drain_cv_.notify_one();

    const auto deadline = std::chrono::steady_clock::now() + descriptor_.startup_timeout;
    auto remaining = [&] {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(1));
    };

    nlohmann::json init_params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "mcp-relay"}, {"version", kVersion}}},
    };
    auto init = CallInternal("initialize", init_params, remaining());
    if (init.IsOk()) {
        const auto& result = init.Value();
        if (result.is_object() && result.contains("protocolVersion")) {
            LogDebug(kComponent, "'" + descriptor_.id + "' negotiated protocol " +
                                     result["protocolVersion"].dump());
        }
        init = CallInternal("notifications/initialized", nlohmann::json::object(),
                            remaining(), true);
    }
    if (init.IsErr()) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "initialize failed: " + init.Error().message;
        LogError(kComponent, "'" + descriptor_.id + "' " + last_error_);
        return false;
    }

    auto tools = FetchTools(deadline);
    std::lock_guard<std::mutex> lock(mutex_);
    if (tools.IsErr()) {
        last_error_ = "tools/list failed: " + tools.Error().message;
        LogError(kComponent, "'" + descriptor_.id + "' " + last_error_);
        return false;
    }
    if (stopping_ || child_eof_) {
        if (child_eof_) last_error_ = "process exited during startup";
        return false;
    }

    tools_ = std::move(tools).Value();
    SetState(ServerState::Ready);
    if (hooks_.on_ready) hooks_.on_ready(descriptor_.id, tools_);
    LogInfo(kComponent, "Server '" + descriptor_.id + "' ready with " +
                            std::to_string(tools_.size()) + " tool(s)");
    return true;
}

Result<std::vector<ToolInfo>, Error> ServerProcess::FetchTools(
    std::chrono::steady_clock::time_point deadline) {
    using R = Result<std::vector<ToolInfo>, Error>;
    std::vector<ToolInfo> tools;
    nlohmann::json params = nlohmann::json::object();

    for (int page = 0; page < kMaxToolPages; ++page) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        auto listed = CallInternal("tools/list", params,
                                   std::max(left, std::chrono::milliseconds(1)));
        if (listed.IsErr()) return R::Err(std::move(listed).Error());

        const auto& result = listed.Value();
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
            return R::Err(MakeError(ErrorCategory::Internal, "tools/list",
                                    "response has no tools array", descriptor_.id));
        }
        for (const auto& tool : result["tools"]) {
            if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string()) {
                LogWarn(kComponent, "'" + descriptor_.id + "' advertised a tool without a name");
                continue;
            }
            tools.push_back(ToolInfo{tool["name"].get<std::string>(), tool});
        }

        auto cursor = result.find("nextCursor");
        if (cursor == result.end() || !cursor->is_string()) break;
        params = {{"cursor", *cursor}};
    }
    return R::Ok(std::move(tools));
}

void ServerProcess::MonitorWhileHealthy() {
    const auto interval = descriptor_.health_check_interval;
    Lock lock(mutex_);
    while (!stopping_) {
        state_cv_.wait_for(lock, interval,
                           [&] { return stopping_ || child_eof_ || stalled_; });
        if (stopping_) return;

        lock.unlock();
        bool healthy = Probe();
        lock.lock();
        if (stopping_) return;
        if (healthy) continue;

        LeaveReadyLocked(ServerState::Unhealthy);
        auto failed = TakeAllLocked();
        lock.unlock();
        Complete(failed, UnavailableError("Server became unhealthy"));
        lock.lock();

        // One grace probe. A dead process gets none.
        if (!child_eof_) {
            state_cv_.wait_for(lock, interval, [&] { return stopping_ || child_eof_; });
        }
        if (stopping_) return;
        lock.unlock();
        bool recovered = Probe();
        lock.lock();
        if (stopping_) return;
        if (!recovered) {
            last_error_ = child_eof_ ? "process exited" : "health probe failed";
            return;
        }

        SetState(ServerState::Ready);
        if (hooks_.on_ready) hooks_.on_ready(descriptor_.id, tools_);
        LogInfo(kComponent, "Server '" + descriptor_.id + "' recovered");
    }
}

bool ServerProcess::Probe() {
    std::shared_ptr<IChildProcess> child;
    bool idle = false;
    bool stalled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (child_eof_ || !child_) return false;
        child = child_;
        idle = queue_.empty() && in_flight_.empty();
        stalled = stalled_;
        stalled_ = false;
    }
    if (!child->IsAlive()) return false;
    // A busy server is not pinged unless one of its calls expired silently.
    if (stalled) {
        LogWarn(kComponent, "A call to '" + descriptor_.id +
                                "' expired with no output from the server, pinging");
    } else if (!idle) {
        return true;
    }

    auto timeout = std::min(descriptor_.health_check_interval, descriptor_.call_timeout);
    auto pong = CallInternal("ping", nlohmann::json::object(), timeout);
    if (pong.IsOk()) return true;

    // Any reply at all, even an error for an unsupported ping, proves the
    // server is reading its input.
    const auto category = pong.Error().category;
    bool responded = category != ErrorCategory::Timeout &&
                     category != ErrorCategory::ServerUnavailable;
    if (!responded) {
        LogWarn(kComponent, "Health probe of '" + descriptor_.id + "' failed: " +
                                pong.Error().message);
    }
    return responded;
}

void ServerProcess::HandleFailure(Lock& lock) {
    LeaveReadyLocked(ServerState::Restarting);
    auto failed = TakeAllLocked();
    lock.unlock();
    Complete(failed, UnavailableError("Server is restarting"));
    ShutdownChild(false);
    lock.lock();

    // Fatal once the count has gone past the allowed attempts: a server with
    // max_restart_attempts N is restarted N + 1 times before giving up.
    if (!descriptor_.restart_on_failure ||
        restart_count_ > descriptor_.max_restart_attempts) {
        SetState(ServerState::Fatal);
        LogError(kComponent, "Server '" + descriptor_.id + "' is fatal after " +
                                 std::to_string(restart_count_) + " restart(s): " +
                                 last_error_);
        return;
    }

    auto delay = BackoffDelay(descriptor_.backoff_base, descriptor_.backoff_cap,
                              restart_count_);
    LogWarn(kComponent, "Restarting '" + descriptor_.id + "' in " + Millis(delay) +
                            " (restart " + std::to_string(restart_count_ + 1) + ", max " +
                            std::to_string(descriptor_.max_restart_attempts) + ")");
    state_cv_.wait_for(lock, delay, [&] { return stopping_; });
    ++restart_count_;
}

void ServerProcess::ShutdownChild(bool graceful) {
    std::shared_ptr<IChildProcess> child;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        child = child_;
    }

    if (child) {
        if (graceful) {
            child->CloseStdin();
            if (!child->WaitForExit(kStdinGrace)) {
                child->Terminate();
                if (!child->WaitForExit(kTerminateGrace)) {
                    LogWarn(kComponent, "'" + descriptor_.id + "' ignored SIGTERM, killing");
                    child->Kill();
                    (void)child->WaitForExit(kKillWait);
                }
            }
        } else {
            child->Kill();
            (void)child->WaitForExit(kKillWait);
        }
    }

    if (reader_.joinable()) reader_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    child_.reset();
    child_eof_ = false;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

Result<std::future<CallResult>, Error> ServerProcess::SubmitLocked(
    const std::string& session, const std::string& method,
    const nlohmann::json& params, bool internal,
    std::chrono::milliseconds timeout, bool notification) {
    if (stopping_) {
        return Result<std::future<CallResult>, Error>::Err(
            UnavailableError("Server is shutting down"));
    }
    auto call = std::make_shared<PendingCall>();
    call->internal_id = notification ? 0 : next_id_++;
    call->session = session;
    call->method = method;
    call->params = params;
    call->deadline = std::chrono::steady_clock::now() + timeout;
    call->internal = internal;
    call->notification = notification;

    auto future = call->promise.get_future();
    // Probes go ahead of queued tool calls so a backlog cannot time them out.
    if (internal) {
        queue_.push_front(std::move(call));
    } else {
        queue_.push_back(std::move(call));
    }
    drain_cv_.notify_one();
    return Result<std::future<CallResult>, Error>::Ok(std::move(future));
}

CallResult ServerProcess::CallInternal(const std::string& method,
                                       const nlohmann::json& params,
                                       std::chrono::milliseconds timeout,
                                       bool notification) {
    auto submitted = [&] {
        std::lock_guard<std::mutex> lock(mutex_);
        return SubmitLocked("", method, params, true, timeout, notification);
    }();
    if (submitted.IsErr()) return CallResult::Err(std::move(submitted).Error());
    // Completed by a response, the drain thread's deadline check, EOF or Stop.
    return std::move(submitted).Value().get();
}

void ServerProcess::DrainLoop() {
    Lock lock(mutex_);
    while (true) {
        auto expired = TakeExpiredLocked(std::chrono::steady_clock::now());
        if (!expired.empty()) {
            lock.unlock();
            for (auto& call : expired) {
                LogWarn(kComponent, call->method + " on '" + descriptor_.id +
                                        "' timed out");
                Complete(call, CallResult::Err(MakeError(
                                   ErrorCategory::Timeout, call->method,
                                   "Request timed out", descriptor_.id)));
            }
            lock.lock();
            continue;
        }
        if (stopping_) break;

        bool can_send = child_ && !child_eof_ && !queue_.empty() &&
                        in_flight_.size() < descriptor_.max_in_flight;
        if (can_send) {
            auto call = queue_.front();
            queue_.pop_front();
            auto child = child_;
            nlohmann::json message = call->notification
                ? MakeNotification(call->method, call->params)
                : MakeRequest(call->internal_id, call->method, call->params);
            if (!call->notification) in_flight_[call->internal_id] = call;
            call->sent_at = std::chrono::steady_clock::now();

            lock.unlock();
            auto written = child->WriteLine(message.dump());
            lock.lock();

            if (written.IsErr()) {
                in_flight_.erase(call->internal_id);
                bool complete = MarkCompletedLocked(call);
                child_eof_ = true;
                state_cv_.notify_all();
                lock.unlock();
                if (complete) Complete(call, CallResult::Err(written.Error()));
                lock.lock();
            } else if (call->notification && MarkCompletedLocked(call)) {
                lock.unlock();
                Complete(call, CallResult::Ok(nullptr));
                lock.lock();
            }
            continue;
        }

        std::optional<std::chrono::steady_clock::time_point> next;
        for (const auto& call : queue_) {
            if (!next || call->deadline < *next) next = call->deadline;
        }
        for (const auto& [id, call] : in_flight_) {
            if (!next || call->deadline < *next) next = call->deadline;
        }
        if (next) {
            drain_cv_.wait_until(lock, *next);
        } else {
            drain_cv_.wait(lock);
        }
    }
}

void ServerProcess::ReaderLoop(std::shared_ptr<IChildProcess> child, uint64_t generation) {
    while (auto line = child->ReadLine()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation == generation_) last_output_ = std::chrono::steady_clock::now();
        }
        HandleLine(*line);
    }

    std::vector<CallPtr> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
        child_eof_ = true;
        failed = TakeAllLocked();
        if (last_error_.empty() || state_ == ServerState::Ready) {
            last_error_ = "process exited";
        }
    }
    LogWarn(kComponent, "'" + descriptor_.id + "' closed its stdout");
    state_cv_.notify_all();
    drain_cv_.notify_all();
    Complete(failed, UnavailableError("Server process exited"));
}

void ServerProcess::HandleLine(const std::string& line) {
    auto message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        LogDebug(kComponent, "'" + descriptor_.id + "' stdout: " + line);
        return;
    }
    if (message.contains("method") || !message.contains("id") ||
        !message["id"].is_number_integer()) {
        LogDebug(kComponent, "Ignoring unsolicited message from '" + descriptor_.id + "'");
        return;
    }

    const auto id = message["id"].get<int64_t>();
    CallPtr call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(id);
        if (it == in_flight_.end()) {
            LogDebug(kComponent, "Discarding late response " + std::to_string(id) +
                                     " from '" + descriptor_.id + "'");
            return;
        }
        call = it->second;
        in_flight_.erase(it);
        if (!MarkCompletedLocked(call)) {
            LogDebug(kComponent, "Discarding response to cancelled call " +
                                     std::to_string(id));
            call.reset();
        }
    }
    drain_cv_.notify_one();
    if (!call) return;

    auto error = message.find("error");
    if (error != message.end() && !error->is_null()) {
        Complete(call, CallResult::Err(ToolError(*error, call->method, descriptor_.id)));
        return;
    }
    auto result = message.find("result");
    Complete(call, CallResult::Ok(result != message.end() ? *result : nlohmann::json(nullptr)));
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void ServerProcess::SetState(ServerState next) {
    if (state_ == next) return;
    LogInfo(kComponent, "'" + descriptor_.id + "' " + ServerStateName(state_) + " -> " +
                            ServerStateName(next));
    state_ = next;
    state_cv_.notify_all();
}

void ServerProcess::LeaveReadyLocked(ServerState next) {
    if (state_ == ServerState::Ready && hooks_.on_withdrawn) {
        hooks_.on_withdrawn(descriptor_.id);
    }
    SetState(next);
}

std::vector<ServerProcess::CallPtr> ServerProcess::TakeAllLocked() {
    std::vector<CallPtr> out;
    for (auto& call : queue_) {
        if (MarkCompletedLocked(call)) out.push_back(call);
    }
    for (auto& [id, call] : in_flight_) {
        if (MarkCompletedLocked(call)) out.push_back(call);
    }
    queue_.clear();
    in_flight_.clear();
    return out;
}

std::vector<ServerProcess::CallPtr> ServerProcess::TakeExpiredLocked(
    std::chrono::steady_clock::time_point now) {
    std::vector<CallPtr> out;
    for (auto it = queue_.begin(); it != queue_.end();) {
        if ((*it)->deadline <= now) {
            if (MarkCompletedLocked(*it)) out.push_back(*it);
            it = queue_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (it->second->deadline <= now) {
            // Probes time out on their own; a tool call that expires without
            // any output since it was written means the child stopped reading.
            if (!it->second->internal && last_output_ < it->second->sent_at) {
                stalled_ = true;
                state_cv_.notify_all();
            }
            if (MarkCompletedLocked(it->second)) out.push_back(it->second);
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }
    return out;
}

bool ServerProcess::MarkCompletedLocked(const CallPtr& call) {
    if (call->completed) return false;
    call->completed = true;
    return true;
}

void ServerProcess::Complete(std::vector<CallPtr>& calls, const Error& error) {
    for (auto& call : calls) {
        Error e = error;
        if (e.operation.empty() || e.operation == "ServerProcess") e.operation = call->method;
        Complete(call, CallResult::Err(std::move(e)));
    }
}

void ServerProcess::Complete(const CallPtr& call, CallResult result) {
    call->promise.set_value(std::move(result));
}

Error ServerProcess::UnavailableError(const std::string& message) const {
    return MakeError(ErrorCategory::ServerUnavailable, "ServerProcess", message,
                     descriptor_.id);
}

} // namespace mcp_relay
