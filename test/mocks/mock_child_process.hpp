#pragma once

#include <mcp_relay/process/child_process.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mcp_relay {
namespace testing {

// ---------------------------------------------------------------------------
// MockServerScript — how a scripted tool server answers.
//
// Usage:
//   MockServerScript script;
//   script.tools = {{{"name", "echo"}}};
//   script.hang_tools = {"slow"};
//   MockProcessLauncher launcher(script);
//   ServerProcess server(descriptor, launcher);
//
// tools/call on "echo" answers with the `text` argument; tools named in
// `hang_tools` never answer, in `crash_tools` close stdout, in `error_tools`
// answer with that JSON-RPC error code.
// ---------------------------------------------------------------------------
struct MockServerScript {
    std::vector<nlohmann::json> tools = {
        {{"name", "echo"}, {"description", "Echo the text argument"},
         {"inputSchema", {{"type", "object"}}}},
    };
    std::size_t page_size = 0;  // 0: all tools on one page
    bool answer_initialize = true;
    bool answer_ping = true;
    bool exit_on_stdin_close = true;
    std::set<std::string> hang_tools;
    std::set<std::string> crash_tools;
    std::map<std::string, int> error_tools;
    std::chrono::milliseconds reply_delay{0};
    std::optional<nlohmann::json> resources;  // nullopt: method not found
    std::optional<nlohmann::json> prompts;
};

// Shared between the mock child (owned by the ServerProcess) and the test.
class MockChildState {
public:
    explicit MockChildState(MockServerScript script, int pid)
        : script_(std::move(script)), pid_(pid) {}

    // -- IChildProcess side -------------------------------------------------

    Result<void, Error> WriteLine(std::string_view line) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (exited_ || stdin_closed_) {
            return Result<void, Error>::Err(MakeError(
                ErrorCategory::ServerUnavailable, "WriteLine", "broken pipe"));
        }
        auto message = nlohmann::json::parse(std::string(line), nullptr, false);
        received_.push_back(message);
        cv_.notify_all();
        if (message.is_discarded() || !message.contains("id")) return Result<void, Error>::Ok();

        auto method = message.value("method", std::string());
        const auto& id = message["id"];
        const auto params = message.value("params", nlohmann::json::object());

        if (method == "initialize") {
            if (script_.answer_initialize) {
                ReplyLocked(id, {{"protocolVersion", "2025-06-18"},
                                 {"capabilities", {{"tools", nlohmann::json::object()}}},
                                 {"serverInfo", {{"name", "mock"}, {"version", "1"}}}});
            }
        } else if (method == "tools/list") {
            ReplyLocked(id, ToolsPage(params));
        } else if (method == "ping") {
            if (script_.answer_ping) ReplyLocked(id, nlohmann::json::object());
        } else if (method == "tools/call") {
            auto name = params.value("name", std::string());
            auto arguments = params.value("arguments", nlohmann::json::object());
            if (script_.hang_tools.count(name) > 0) {
                // never answers
            } else if (script_.crash_tools.count(name) > 0) {
                ExitLocked();
            } else if (auto err = script_.error_tools.find(name);
                       err != script_.error_tools.end()) {
                ErrorLocked(id, err->second, "tool '" + name + "' failed");
            } else {
                ReplyLocked(id, {{"content", {{{"type", "text"},
                                               {"text", arguments.value("text", name)}}}}});
            }
        } else if (method == "resources/list" && script_.resources) {
            ReplyLocked(id, {{"resources", *script_.resources}});
        } else if (method == "prompts/list" && script_.prompts) {
            ReplyLocked(id, {{"prompts", *script_.prompts}});
        } else {
            ErrorLocked(id, -32601, "Method not found");
        }
        return Result<void, Error>::Ok();
    }

    std::optional<std::string> ReadLine() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            if (!outbox_.empty()) {
                auto due = outbox_.front().first;
                if (std::chrono::steady_clock::now() >= due) {
                    auto line = std::move(outbox_.front().second);
                    outbox_.pop_front();
                    return line;
                }
                if (cv_.wait_until(lock, due, [&] { return stdout_closed_; })) {
                    return std::nullopt;
                }
                continue;
            }
            if (stdout_closed_) return std::nullopt;
            cv_.wait(lock);
        }
    }

    void CloseStdin() {
        std::lock_guard<std::mutex> lock(mutex_);
        stdin_closed_ = true;
        if (script_.exit_on_stdin_close) ExitLocked();
    }

    bool IsAlive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return !exited_;
    }

    bool WaitForExit(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return exited_; });
    }

    void Signal(bool kill) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (kill) {
            ++kills_;
        } else {
            ++terminates_;
        }
        ExitLocked();
    }

    [[nodiscard]] int Pid() const { return pid_; }

    // -- Test side ----------------------------------------------------------

    /// Simulate a crash: the process exits and its stdout closes.
    void Crash() {
        std::lock_guard<std::mutex> lock(mutex_);
        ExitLocked();
    }

    /// Stop answering pings and tool calls without exiting.
    void Freeze() {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.answer_ping = false;
        for (const auto& tool : script_.tools) {
            script_.hang_tools.insert(tool.value("name", std::string()));
        }
    }

    /// Write an unsolicited line to stdout.
    void Emit(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        outbox_.emplace_back(std::chrono::steady_clock::now(), line);
        cv_.notify_all();
    }

    [[nodiscard]] std::vector<nlohmann::json> Received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    [[nodiscard]] std::vector<std::string> ReceivedMethods() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> methods;
        for (const auto& message : received_) {
            methods.push_back(message.value("method", std::string()));
        }
        return methods;
    }

    /// Block until `count` messages with `method` have been written to stdin.
    bool WaitForReceived(const std::string& method, std::size_t count,
                         std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            std::size_t seen = 0;
            for (const auto& message : received_) {
                if (message.value("method", std::string()) == method) ++seen;
            }
            return seen >= count;
        });
    }

    [[nodiscard]] bool StdinClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stdin_closed_;
    }

    [[nodiscard]] int Kills() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return kills_;
    }

    [[nodiscard]] int Terminates() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminates_;
    }

private:
    nlohmann::json ToolsPage(const nlohmann::json& params) const {
        if (script_.page_size == 0) return {{"tools", script_.tools}};
        std::size_t start = 0;
        if (params.contains("cursor")) {
            start = std::stoul(params["cursor"].get<std::string>());
        }
        auto end = std::min(start + script_.page_size, script_.tools.size());
        nlohmann::json page = {{"tools", nlohmann::json::array()}};
        for (auto i = start; i < end; ++i) page["tools"].push_back(script_.tools[i]);
        if (end < script_.tools.size()) page["nextCursor"] = std::to_string(end);
        return page;
    }

    void ReplyLocked(const nlohmann::json& id, const nlohmann::json& result) {
        PushLocked({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
    }

    void ErrorLocked(const nlohmann::json& id, int code, const std::string& message) {
        PushLocked({{"jsonrpc", "2.0"}, {"id", id},
                    {"error", {{"code", code}, {"message", message}}}});
    }

    void PushLocked(const nlohmann::json& message) {
        outbox_.emplace_back(std::chrono::steady_clock::now() + script_.reply_delay,
                             message.dump());
        cv_.notify_all();
    }

    void ExitLocked() {
        exited_ = true;
        stdout_closed_ = true;
        outbox_.clear();
        cv_.notify_all();
    }

    MockServerScript script_;
    const int pid_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::pair<std::chrono::steady_clock::time_point, std::string>> outbox_;
    std::vector<nlohmann::json> received_;
    bool stdin_closed_ = false;
    bool stdout_closed_ = false;
    bool exited_ = false;
    int kills_ = 0;
    int terminates_ = 0;
};

class MockChildProcess : public IChildProcess {
public:
    explicit MockChildProcess(std::shared_ptr<MockChildState> state)
        : state_(std::move(state)) {}

    Result<void, Error> WriteLine(std::string_view line) override {
        return state_->WriteLine(line);
    }
    std::optional<std::string> ReadLine() override { return state_->ReadLine(); }
    void CloseStdin() override { state_->CloseStdin(); }
    bool IsAlive() override { return state_->IsAlive(); }
    bool WaitForExit(std::chrono::milliseconds timeout) override {
        return state_->WaitForExit(timeout);
    }
    void Terminate() override { state_->Signal(false); }
    void Kill() override { state_->Signal(true); }
    int Pid() const override { return state_->Pid(); }

private:
    std::shared_ptr<MockChildState> state_;
};

// ---------------------------------------------------------------------------
// MockProcessLauncher — hands out scripted children and remembers them.
// ---------------------------------------------------------------------------
class MockProcessLauncher : public IProcessLauncher {
public:
    explicit MockProcessLauncher(MockServerScript script = {})
        : script_(std::move(script)) {}

    Result<std::unique_ptr<IChildProcess>, Error> Launch(
        const ServerDescriptor& descriptor) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++launches_;
        launch_times_.push_back(std::chrono::steady_clock::now());
        if (fail_launch_) {
            return Result<std::unique_ptr<IChildProcess>, Error>::Err(MakeError(
                ErrorCategory::ServerUnavailable, "Launch", "spawn failed", descriptor.id));
        }
        auto script = script_;
        if (auto it = per_server_.find(descriptor.id); it != per_server_.end()) {
            script = it->second;
        }
        auto state = std::make_shared<MockChildState>(script, 1000 + launches_);
        children_.emplace_back(descriptor.id, state);
        return Result<std::unique_ptr<IChildProcess>, Error>::Ok(
            std::make_unique<MockChildProcess>(state));
    }

    void SetFailLaunch(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_launch_ = fail;
    }

    void SetScript(MockServerScript script) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_ = std::move(script);
    }

    void SetScriptFor(const std::string& server_id, MockServerScript script) {
        std::lock_guard<std::mutex> lock(mutex_);
        per_server_[server_id] = std::move(script);
    }

    [[nodiscard]] int Launches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return launches_;
    }

    [[nodiscard]] std::vector<std::chrono::steady_clock::time_point> LaunchTimes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return launch_times_;
    }

    /// Most recently launched child; nullptr before the first launch.
    [[nodiscard]] std::shared_ptr<MockChildState> Latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return children_.empty() ? nullptr : children_.back().second;
    }

    /// Most recently launched child of one server.
    [[nodiscard]] std::shared_ptr<MockChildState> LatestFor(const std::string& server_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
            if (it->first == server_id) return it->second;
        }
        return nullptr;
    }

private:
    mutable std::mutex mutex_;
    MockServerScript script_;
    std::map<std::string, MockServerScript> per_server_;
    bool fail_launch_ = false;
    int launches_ = 0;
    std::vector<std::chrono::steady_clock::time_point> launch_times_;
    std::vector<std::pair<std::string, std::shared_ptr<MockChildState>>> children_;
};

} // namespace testing
} // namespace mcp_relay
