#include <mcp_relay/auth/auth_gate.hpp>
#include <mcp_relay/auth/policy_engine.hpp>
#include <mcp_relay/bridge/bridge.hpp>
#include <mcp_relay/bridge/control_plane_client.hpp>
#include <mcp_relay/config/config_loader.hpp>
#include <mcp_relay/core/log.hpp>
#include <mcp_relay/core/version.hpp>
#include <mcp_relay/process/lifecycle_manager.hpp>
#include <mcp_relay/process/posix_process.hpp>
#include <mcp_relay/routing/request_router.hpp>
#include <mcp_relay/routing/tool_registry.hpp>
#include <mcp_relay/server/control_plane_service.hpp>
#include <mcp_relay/server/http_control_plane.hpp>

#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <pthread.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage   = 2;

enum class Subcommand { Serve, Bridge };

std::optional<Subcommand> ParseSubcommand(int argc, const char* const* argv) {
    if (argc < 2) return std::nullopt;
    std::string_view arg1{argv[1]};
    if (arg1 == "serve") return Subcommand::Serve;
    if (arg1 == "bridge") return Subcommand::Bridge;
    return std::nullopt;
}

// Drop argv[1] so the subcommand's parser sees only flags.
std::vector<const char*> StripSubcommand(int argc, const char* const* argv) {
    std::vector<const char*> result;
    result.push_back(argv[0]);
    for (int i = 2; i < argc; ++i) {
        result.push_back(argv[i]);
    }
    return result;
}

void PrintTopLevelHelp(std::ostream& out) {
    out << "mcp-relay " << mcp_relay::kVersion << "\n\n"
        << "Usage:\n"
        << "  mcp-relay serve  [--config FILE] [--host ADDR] [--port N] [--log-level LEVEL]\n"
        << "  mcp-relay bridge [--url URL] [--token TOKEN] [--timeout SECONDS]\n\n"
        << "Commands:\n"
        << "  serve   Run the control plane: supervise tool servers, serve HTTP\n"
        << "  bridge  Speak MCP on stdin/stdout and forward to a control plane\n\n"
        << "Run 'mcp-relay <command> --help' for command flags.\n";
}

void PrintError(const mcp_relay::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Route logs to stderr (human or JSON) and optionally tee them to a file.
mcp_relay::Result<void, mcp_relay::Error> ConfigureLogging(
    const std::string& level_name, const std::optional<std::string>& log_file,
    bool json) {
    using namespace mcp_relay;

    auto level = ParseLogLevel(level_name);
    if (!level.has_value()) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Config, "ConfigLoader", "Unknown log level '" + level_name + "'"));
    }

    std::unique_ptr<ILogSink> console;
    if (json) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        console = std::make_unique<ConsoleSink>(std::cerr);
    }

    if (!log_file.has_value()) {
        InitGlobalLogger(std::move(console), *level);
        return Result<void, Error>::Ok();
    }

    auto file = std::make_unique<FileSink>(*log_file, json);
    if (!file->IsOpen()) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Config, "ConfigLoader", "Cannot open log file", *log_file));
    }
    std::vector<std::unique_ptr<ILogSink>> sinks;
    sinks.push_back(std::move(console));
    sinks.push_back(std::move(file));
    InitGlobalLogger(std::make_unique<TeeSink>(std::move(sinks)), *level);
    return Result<void, Error>::Ok();
}

// Block SIGINT/SIGTERM/SIGHUP in every thread and hand them to a dedicated
// waiter. Must run before any other thread is created.
class SignalWatcher {
public:
    explicit SignalWatcher(std::function<void()> on_signal,
                           std::function<void()> on_reload = {})
        : on_signal_(std::move(on_signal)), on_reload_(std::move(on_reload)) {
        std::signal(SIGPIPE, SIG_IGN);
        sigemptyset(&set_);
        sigaddset(&set_, SIGINT);
        sigaddset(&set_, SIGTERM);
        sigaddset(&set_, SIGHUP);
        sigaddset(&set_, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &set_, nullptr);
        thread_ = std::thread([this] {
            while (true) {
                int signal_number = 0;
                sigwait(&set_, &signal_number);
                if (signal_number == SIGUSR1) return;  // Dismiss()
                if (signal_number == SIGHUP) {
                    if (on_reload_) {
                        mcp_relay::LogInfo("main", "Received SIGHUP, reloading policy");
                        on_reload_();
                    } else {
                        mcp_relay::LogInfo("main", "Received SIGHUP, nothing to reload");
                    }
                    continue;
                }
                mcp_relay::LogInfo("main", std::string("Received ") +
                                               (signal_number == SIGINT ? "SIGINT" : "SIGTERM") +
                                               ", shutting down");
                on_signal_();
                return;
            }
        });
    }

    ~SignalWatcher() { Dismiss(); }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Release the waiter thread when the program ends on its own.
    void Dismiss() {
        if (!thread_.joinable()) return;
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

private:
    std::function<void()> on_signal_;
    std::function<void()> on_reload_;
    sigset_t set_{};
    std::thread thread_;
};

// ---------------------------------------------------------------------------
// serve
// ---------------------------------------------------------------------------

mcp_relay::Result<mcp_relay::ControlPlaneConfig, mcp_relay::Error> ResolveServeConfig(
    const mcp_relay::ServeCliOptions& cli, const mcp_relay::EnvLookup& env,
    std::optional<std::string>& path) {
    using namespace mcp_relay;

    path = cli.config_path;
    if (!path.has_value()) path = FindDefaultConfigFile(env);

    auto loaded = path.has_value() ? LoadControlPlaneConfig(*path)
                                   : LoadControlPlaneFromEnv(env);
    if (loaded.IsErr()) return loaded;
    if (path.has_value()) {
        LogInfo("main", "Configuration loaded from " + *path);
    } else {
        LogInfo("main", "No config file found, using environment");
    }

    auto resolved = ResolveTokenEnv(ApplyServeOverrides(std::move(loaded).Value(), cli), env);
    if (resolved.IsErr()) return resolved;

    auto valid = ValidateControlPlaneConfig(resolved.Value());
    if (valid.IsErr()) {
        return Result<ControlPlaneConfig, Error>::Err(valid.Error());
    }
    return resolved;
}

// Re-read the config file and swap in its policy. Credentials and tool
// servers keep their startup values; a bad file leaves the old rules active.
void ReloadPolicy(const std::optional<std::string>& path, mcp_relay::PolicyEngine& policy) {
    using namespace mcp_relay;

    if (!path.has_value()) {
        LogWarn("main", "Configuration came from the environment, no policy to reload");
        return;
    }
    auto loaded = LoadControlPlaneConfig(*path);
    if (loaded.IsErr()) {
        LogError("main", "Policy reload failed, keeping current rules: " +
                             loaded.Error().ToString());
        return;
    }
    auto rules = PolicyRulesFor(loaded.Value());
    if (rules.IsErr()) {
        LogError("main", "Policy reload failed, keeping current rules: " +
                             rules.Error().ToString());
        return;
    }
    policy.Reload(std::move(rules).Value());
    LogInfo("main", "Policy reloaded from " + *path + ": " +
                        std::to_string(policy.RuleCount()) + " rule(s)");
}

int HandleServe(int argc, const char* const* argv) {
    using namespace mcp_relay;

    auto cli = ParseServeCli(argc, argv);
    if (cli.IsErr()) {
        PrintError(cli.Error());
        return cli.Error().ExitCode();
    }
    const auto env = ProcessEnvironment();

    std::optional<std::string> config_path;
    auto config_result = ResolveServeConfig(cli.Value(), env, config_path);
    if (config_result.IsErr()) {
        PrintError(config_result.Error());
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    auto logging = ConfigureLogging(config.server.log_level, config.server.log_file,
                                    config.server.json_logs);
    if (logging.IsErr()) {
        PrintError(logging.Error());
        return logging.Error().ExitCode();
    }

    auto credentials = BuildCredentials(config.credentials);
    if (credentials.IsErr()) {
        PrintError(credentials.Error());
        return credentials.Error().ExitCode();
    }
    if (credentials.Value().empty()) {
        LogWarn("main", "No credentials configured, every request will be rejected");
    }

    auto rules = PolicyRulesFor(config);
    if (rules.IsErr()) {
        PrintError(rules.Error());
        return rules.Error().ExitCode();
    }
    if (!config.has_policy) {
        LogWarn("main", "No policy configured, allowing every authenticated principal");
    }

    AuthGate gate(std::move(credentials).Value());
    PolicyEngine policy(std::move(rules).Value());
    PosixProcessLauncher launcher;
    ToolRegistry registry;
    LifecycleManager lifecycle(config.mcp_servers, launcher, registry);
    RequestRouter router(registry, lifecycle);
    ControlPlaneService service(gate, policy, router, lifecycle);

    HttpServerOptions http_options;
    http_options.host = config.server.host;
    http_options.port = config.server.port;
    http_options.threads = config.server.threads;
    HttpControlPlane http(service, http_options);

    SignalWatcher signals([&http] { http.Stop(); },
                          [&] { ReloadPolicy(config_path, policy); });

    auto bound = http.Bind();
    if (bound.IsErr()) {
        PrintError(bound.Error());
        return bound.Error().ExitCode();
    }
    LogInfo("main", "mcp-relay " + std::string(kVersion) + " listening on " +
                        config.server.host + ":" + std::to_string(bound.Value()) + " with " +
                        std::to_string(config.mcp_servers.size()) + " tool server(s), " +
                        std::to_string(gate.CredentialCount()) + " credential(s), " +
                        std::to_string(policy.RuleCount()) + " policy rule(s)");

    lifecycle.Start();
    auto served = http.Serve();
    LogInfo("main", "HTTP server stopped, shutting down tool servers");
    lifecycle.Stop();
    signals.Dismiss();

    if (served.IsErr()) {
        PrintError(served.Error());
        return served.Error().ExitCode();
    }
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// bridge
// ---------------------------------------------------------------------------

int HandleBridge(int argc, const char* const* argv) {
    using namespace mcp_relay;

    auto config_result = LoadBridgeConfig(argc, argv, ProcessEnvironment());
    if (config_result.IsErr()) {
        PrintError(config_result.Error());
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();
    auto valid = ValidateBridgeConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    auto logging = ConfigureLogging(config.log_level, config.log_file, false);
    if (logging.IsErr()) {
        PrintError(logging.Error());
        return logging.Error().ExitCode();
    }

    ControlPlaneClientOptions client_options;
    client_options.base_url = config.control_plane_url;
    client_options.token = config.auth_token;
    client_options.session_id = NewSessionId();
    client_options.timeout = config.timeout;
    HttpControlPlaneClient client(client_options);

    BridgeOptions bridge_options;
    bridge_options.workers = config.workers;
    bridge_options.retry_attempts = config.retry_attempts;
    bridge_options.reconnect_base = config.reconnect_base;
    bridge_options.reconnect_cap = config.reconnect_cap;

    // stdout carries the protocol; keep C stdio out of it.
    std::ios::sync_with_stdio(false);
    Bridge bridge(client, bridge_options, std::cin, std::cout);
    SignalWatcher signals([&bridge] { bridge.RequestStop(); });

    LogInfo("main", "Bridging stdio to " + config.control_plane_url + " as session " +
                        client_options.session_id);
    auto code = bridge.Run();
    signals.Dismiss();
    return code;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_relay;

    // Until a subcommand configures logging, warnings go to stderr.
    InitGlobalLogger(std::make_unique<ConsoleSink>(std::cerr), LogLevel::Info);

    auto subcommand = ParseSubcommand(argc, argv);
    if (!subcommand.has_value()) {
        if (argc >= 2) {
            std::string_view arg1{argv[1]};
            if (arg1 == "--version" || arg1 == "-V") {
                std::cout << "mcp-relay " << kVersion << "\n";
                return kExitSuccess;
            }
            if (arg1 == "--help" || arg1 == "-h") {
                PrintTopLevelHelp(std::cout);
                return kExitSuccess;
            }
            std::cerr << "Unknown command '" << arg1 << "'\n\n";
        }
        PrintTopLevelHelp(std::cerr);
        return kExitUsage;
    }

    auto stripped = StripSubcommand(argc, argv);
    auto stripped_argc = static_cast<int>(stripped.size());
    switch (*subcommand) {
        case Subcommand::Serve:  return HandleServe(stripped_argc, stripped.data());
        case Subcommand::Bridge: return HandleBridge(stripped_argc, stripped.data());
    }
    return kExitUsage;
}
