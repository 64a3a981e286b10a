#include <mcp_relay/config/config_loader.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace mcp_relay {

namespace {

Error MakeConfigError(const std::string& message) {
    return MakeError(ErrorCategory::Config, "ConfigLoader", message);
}

std::string Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return std::string(s);
}

std::vector<std::string> SplitTokens(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto token = Trim(item);
        if (!token.empty()) out.push_back(std::move(token));
    }
    return out;
}

std::vector<std::string> ReadStringList(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

std::chrono::milliseconds ReadMillis(const YAML::Node& node,
                                     std::chrono::milliseconds fallback) {
    if (!node) return fallback;
    return std::chrono::milliseconds(node.as<long long>());
}

// ---------------------------------------------------------------------------
// Section parsers. yaml-cpp throws on type mismatches; the caller converts.
// ---------------------------------------------------------------------------

void ParseServerSection(const YAML::Node& node, ServerOptions& server) {
    if (node["host"]) server.host = node["host"].as<std::string>();
    if (node["port"]) {
        auto port = node["port"].as<int>();
        if (port < 1 || port > 65535) {
            throw YAML::Exception(node["port"].Mark(),
                                  "port must be between 1 and 65535");
        }
        server.port = static_cast<uint16_t>(port);
    }
    if (node["threads"]) server.threads = node["threads"].as<int>();
    // "workers" is the older spelling.
    if (node["workers"] && !node["threads"]) server.threads = node["workers"].as<int>();
    if (node["log_level"]) server.log_level = node["log_level"].as<std::string>();
    if (node["log_file"]) server.log_file = node["log_file"].as<std::string>();
    if (node["json_logs"]) server.json_logs = node["json_logs"].as<bool>();
}

CredentialConfig ParseCredential(const YAML::Node& node) {
    CredentialConfig credential;
    if (node.IsScalar()) {
        credential.token = node.as<std::string>();
        return credential;
    }
    if (node["token"]) credential.token = node["token"].as<std::string>();
    if (node["token_env"]) credential.token_env = node["token_env"].as<std::string>();
    if (node["principal"]) credential.principal = node["principal"].as<std::string>();
    credential.permissions = ReadStringList(node["permissions"]);
    return credential;
}

PolicyRuleConfig ParsePolicyRule(const YAML::Node& node) {
    PolicyRuleConfig rule;
    if (node["principal"]) rule.principal = node["principal"].as<std::string>();
    if (node["action"]) rule.action = node["action"].as<std::string>();
    if (node["resource"]) rule.resource = node["resource"].as<std::string>();
    if (node["effect"]) rule.effect = node["effect"].as<std::string>();
    if (node["when"]) {
        for (const auto& entry : node["when"]) {
            rule.when[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
    return rule;
}

Result<ServerDescriptor, Error> ParseServerDescriptor(const YAML::Node& node) {
    ServerDescriptor d;
    if (!node["id"]) {
        return Result<ServerDescriptor, Error>::Err(
            MakeConfigError("mcp_servers entry missing 'id' field"));
    }
    d.id = node["id"].as<std::string>();
    d.name = node["name"] ? node["name"].as<std::string>() : d.id;

    if (node["type"]) {
        auto type_name = node["type"].as<std::string>();
        auto type = ParseServerType(type_name);
        if (!type.has_value()) {
            return Result<ServerDescriptor, Error>::Err(MakeConfigError(
                "Server '" + d.id + "': unknown type '" + type_name +
                "' (expected python, npx, uv or binary)"));
        }
        d.type = *type;
    }

    d.command = ReadStringList(node["command"]);
    d.args = ReadStringList(node["args"]);
    if (node["env"]) {
        for (const auto& entry : node["env"]) {
            d.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
    if (node["working_dir"]) {
        d.working_dir = node["working_dir"].as<std::string>();
    } else if (node["cwd"]) {
        d.working_dir = node["cwd"].as<std::string>();
    }
    if (node["enabled"]) d.enabled = node["enabled"].as<bool>();
    if (node["restart_on_failure"]) {
        d.restart_on_failure = node["restart_on_failure"].as<bool>();
    }

    // "timeout" (seconds) is the older spelling of startup_timeout_ms.
    if (node["timeout"]) {
        d.startup_timeout = std::chrono::seconds(node["timeout"].as<long long>());
    }
    d.startup_timeout = ReadMillis(node["startup_timeout_ms"], d.startup_timeout);
    d.health_check_interval =
        ReadMillis(node["health_check_interval_ms"], d.health_check_interval);
    d.call_timeout = ReadMillis(node["call_timeout_ms"], d.call_timeout);
    d.backoff_base = ReadMillis(node["backoff_base_ms"], d.backoff_base);
    d.backoff_cap = ReadMillis(node["backoff_cap_ms"], d.backoff_cap);
    if (node["max_restart_attempts"]) {
        d.max_restart_attempts = node["max_restart_attempts"].as<int>();
    }
    if (node["queue_capacity"]) {
        d.queue_capacity = node["queue_capacity"].as<std::size_t>();
    }
    if (node["max_in_flight"]) {
        d.max_in_flight = node["max_in_flight"].as<std::size_t>();
    }
    return Result<ServerDescriptor, Error>::Ok(std::move(d));
}

Result<ControlPlaneConfig, Error> ParseRoot(const YAML::Node& root) {
    ControlPlaneConfig config;
    if (!root || root.IsNull()) {
        return Result<ControlPlaneConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<ControlPlaneConfig, Error>::Err(
            MakeConfigError("Config root must be a mapping"));
    }

    if (root["server"]) ParseServerSection(root["server"], config.server);

    if (root["credentials"]) {
        for (const auto& node : root["credentials"]) {
            config.credentials.push_back(ParseCredential(node));
        }
    }
    // Bare token list; each becomes a credential without permissions.
    if (root["auth_tokens"]) {
        for (const auto& token : ReadStringList(root["auth_tokens"])) {
            CredentialConfig credential;
            credential.token = token;
            config.credentials.push_back(std::move(credential));
        }
    }

    if (root["policy"]) {
        config.has_policy = true;
        for (const auto& node : root["policy"]) {
            config.policy.push_back(ParsePolicyRule(node));
        }
    }

    if (root["mcp_servers"]) {
        for (const auto& node : root["mcp_servers"]) {
            auto descriptor = ParseServerDescriptor(node);
            if (descriptor.IsErr()) {
                return Result<ControlPlaneConfig, Error>::Err(
                    std::move(descriptor).Error());
            }
            config.mcp_servers.push_back(std::move(descriptor).Value());
        }
    }
    return Result<ControlPlaneConfig, Error>::Ok(std::move(config));
}

std::optional<std::string> NonEmpty(const EnvLookup& env, const std::string& name) {
    auto value = env(name);
    if (value.has_value() && value->empty()) return std::nullopt;
    return value;
}

} // anonymous namespace

EnvLookup ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
}

// ---------------------------------------------------------------------------
// YAML
// ---------------------------------------------------------------------------
Result<ControlPlaneConfig, Error> ParseControlPlaneYaml(std::string_view yaml_text) {
    try {
        return ParseRoot(YAML::Load(std::string(yaml_text)));
    } catch (const YAML::Exception& e) {
        return Result<ControlPlaneConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
}

Result<ControlPlaneConfig, Error> LoadControlPlaneConfig(std::string_view file_path) {
    try {
        auto root = YAML::LoadFile(std::string(file_path));
        auto result = ParseRoot(root);
        if (result.IsErr()) {
            auto error = std::move(result).Error();
            error.target = std::string(file_path);
            return Result<ControlPlaneConfig, Error>::Err(std::move(error));
        }
        return result;
    } catch (const YAML::BadFile&) {
        return Result<ControlPlaneConfig, Error>::Err(MakeError(
            ErrorCategory::Config, "ConfigLoader", "Cannot open config file",
            std::string(file_path)));
    } catch (const YAML::Exception& e) {
        return Result<ControlPlaneConfig, Error>::Err(MakeError(
            ErrorCategory::Config, "ConfigLoader",
            "Failed to parse YAML file: " + std::string(e.what()),
            std::string(file_path)));
    }
}

// ---------------------------------------------------------------------------
// Environment
// ---------------------------------------------------------------------------
Result<ControlPlaneConfig, Error> LoadControlPlaneFromEnv(const EnvLookup& env) {
    ControlPlaneConfig config;
    if (auto host = NonEmpty(env, "MCP_HOST")) config.server.host = *host;
    if (auto port = NonEmpty(env, "MCP_PORT")) {
        char* end = nullptr;
        long value = std::strtol(port->c_str(), &end, 10);
        if (end == port->c_str() || *end != '\0' || value < 1 || value > 65535) {
            return Result<ControlPlaneConfig, Error>::Err(
                MakeConfigError("MCP_PORT must be a port number, got '" + *port + "'"));
        }
        config.server.port = static_cast<uint16_t>(value);
    }
    if (auto level = NonEmpty(env, "MCP_LOG_LEVEL")) config.server.log_level = *level;
    if (auto tokens = NonEmpty(env, "MCP_AUTH_TOKENS")) {
        for (auto& token : SplitTokens(*tokens)) {
            CredentialConfig credential;
            credential.token = std::move(token);
            config.credentials.push_back(std::move(credential));
        }
    }
    return Result<ControlPlaneConfig, Error>::Ok(std::move(config));
}

std::optional<std::string> FindDefaultConfigFile(const EnvLookup& env) {
    std::vector<std::string> candidates = {
        "config/control_plane.yaml",
        "/etc/mcp/control_plane.yaml",
    };
    if (auto home = NonEmpty(env, "HOME")) {
        candidates.push_back(*home + "/.mcp/control_plane.yaml");
    }
    candidates.push_back("control_plane.yaml");

    for (const auto& path : candidates) {
        std::ifstream probe(path);
        if (probe.good()) return path;
    }
    return std::nullopt;
}

Result<ControlPlaneConfig, Error> ResolveTokenEnv(ControlPlaneConfig config,
                                                  const EnvLookup& env) {
    for (auto& credential : config.credentials) {
        if (!credential.token.empty() || !credential.token_env.has_value()) continue;
        auto value = NonEmpty(env, *credential.token_env);
        if (!value.has_value()) {
            return Result<ControlPlaneConfig, Error>::Err(
                MakeConfigError("Environment variable '" + *credential.token_env +
                                "' not set (specified by token_env)"));
        }
        credential.token = *value;
    }
    return Result<ControlPlaneConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------
Result<void, Error> ValidateControlPlaneConfig(const ControlPlaneConfig& config) {
    if (config.server.host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server.host"));
    }
    if (config.server.port == 0) {
        return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
    }
    if (config.server.threads <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "server.threads must be positive, got " +
            std::to_string(config.server.threads)));
    }
    if (!ParseLogLevel(config.server.log_level).has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid log level: '" + config.server.log_level + "'"));
    }
    if (config.credentials.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("At least one credential must be configured"));
    }
    for (std::size_t i = 0; i < config.credentials.size(); ++i) {
        const auto& credential = config.credentials[i];
        if (credential.token.empty() && !credential.token_env.has_value()) {
            return Result<void, Error>::Err(MakeConfigError(
                "Credential #" + std::to_string(i + 1) + " needs token or token_env"));
        }
    }
    for (const auto& rule : config.policy) {
        if (rule.effect != "allow" && rule.effect != "deny") {
            return Result<void, Error>::Err(MakeConfigError(
                "Policy effect must be 'allow' or 'deny', got '" + rule.effect + "'"));
        }
    }

    std::set<std::string> ids;
    for (const auto& d : config.mcp_servers) {
        if (d.id.empty()) {
            return Result<void, Error>::Err(MakeConfigError("Server id must not be empty"));
        }
        if (!ids.insert(d.id).second) {
            return Result<void, Error>::Err(MakeConfigError("Duplicate server id: " + d.id));
        }
        if (d.command.empty() || d.command.front().empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Server '" + d.id + "': command cannot be empty"));
        }
        if (d.startup_timeout.count() <= 0 || d.call_timeout.count() <= 0 ||
            d.health_check_interval.count() <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError("Server '" + d.id + "': timeouts must be positive"));
        }
        if (d.backoff_base.count() <= 0 || d.backoff_cap < d.backoff_base) {
            return Result<void, Error>::Err(MakeConfigError(
                "Server '" + d.id + "': backoff_base must be positive and <= backoff_cap"));
        }
        if (d.max_restart_attempts < 0) {
            return Result<void, Error>::Err(MakeConfigError(
                "Server '" + d.id + "': max_restart_attempts must not be negative"));
        }
        if (d.queue_capacity == 0 || d.max_in_flight == 0) {
            return Result<void, Error>::Err(MakeConfigError(
                "Server '" + d.id + "': queue_capacity and max_in_flight must be positive"));
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// serve
// ---------------------------------------------------------------------------
Result<ServeCliOptions, Error> ParseServeCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-relay serve", kVersion);
    program.add_description("Run the control plane: authenticate, authorize and "
                            "route MCP calls to managed tool servers.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--host")
        .help("Address to bind");
    program.add_argument("--port")
        .help("Port to bind")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Also append logs to this file");
    program.add_argument("--json-logs")
        .help("Emit logs as JSON lines")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<ServeCliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    ServeCliOptions options;
    options.config_path = program.present("--config");
    options.host = program.present("--host");
    if (auto port = program.present<int>("--port")) {
        if (*port < 1 || *port > 65535) {
            return Result<ServeCliOptions, Error>::Err(
                MakeConfigError("--port must be between 1 and 65535"));
        }
        options.port = static_cast<uint16_t>(*port);
    }
    options.log_level = program.present("--log-level");
    options.log_file = program.present("--log-file");
    options.json_logs = program.get<bool>("--json-logs");
    return Result<ServeCliOptions, Error>::Ok(std::move(options));
}

ControlPlaneConfig ApplyServeOverrides(ControlPlaneConfig config,
                                       const ServeCliOptions& cli) {
    if (cli.host.has_value()) config.server.host = *cli.host;
    if (cli.port.has_value()) config.server.port = *cli.port;
    if (cli.log_level.has_value()) config.server.log_level = *cli.log_level;
    if (cli.log_file.has_value()) config.server.log_file = cli.log_file;
    if (cli.json_logs) config.server.json_logs = true;
    return config;
}

// ---------------------------------------------------------------------------
// bridge
// ---------------------------------------------------------------------------
Result<BridgeConfig, Error> LoadBridgeConfig(int argc, const char* const* argv,
                                             const EnvLookup& env) {
    argparse::ArgumentParser program("mcp-relay bridge", kVersion);
    program.add_description("Expose the control plane as an MCP server on "
                            "stdin/stdout.");

    program.add_argument("--url")
        .help("Control plane base URL (env MCP_CONTROL_PLANE_URL)");
    program.add_argument("--token")
        .help("Bearer token (env MCP_AUTH_TOKEN)");
    program.add_argument("--timeout")
        .help("HTTP timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--retry-attempts")
        .help("Reconnect attempts before giving up")
        .scan<'i', int>();
    program.add_argument("--backoff-base-ms")
        .help("Initial reconnect delay")
        .scan<'i', int>();
    program.add_argument("--backoff-cap-ms")
        .help("Maximum reconnect delay")
        .scan<'i', int>();
    program.add_argument("--workers")
        .help("Concurrent HTTP calls; more than 1 may reorder requests")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Also append logs to this file");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<BridgeConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    BridgeConfig config;
    if (auto url = program.present("--url")) {
        config.control_plane_url = *url;
    } else if (auto url_env = NonEmpty(env, "MCP_CONTROL_PLANE_URL")) {
        config.control_plane_url = *url_env;
    }
    if (auto token = program.present("--token")) {
        config.auth_token = *token;
    } else if (auto token_env = NonEmpty(env, "MCP_AUTH_TOKEN")) {
        config.auth_token = *token_env;
    }
    if (auto timeout = program.present<int>("--timeout")) {
        config.timeout = std::chrono::seconds(*timeout);
    }
    if (auto attempts = program.present<int>("--retry-attempts")) {
        config.retry_attempts = *attempts;
    }
    if (auto base = program.present<int>("--backoff-base-ms")) {
        config.reconnect_base = std::chrono::milliseconds(*base);
    }
    if (auto cap = program.present<int>("--backoff-cap-ms")) {
        config.reconnect_cap = std::chrono::milliseconds(*cap);
    }
    if (auto workers = program.present<int>("--workers")) {
        if (*workers <= 0) {
            return Result<BridgeConfig, Error>::Err(
                MakeConfigError("--workers must be positive"));
        }
        config.workers = static_cast<std::size_t>(*workers);
    }
    if (auto level = program.present("--log-level")) {
        config.log_level = *level;
    } else if (auto level_env = NonEmpty(env, "MCP_LOG_LEVEL")) {
        config.log_level = *level_env;
    }
    config.log_file = program.present("--log-file");

    auto valid = ValidateBridgeConfig(config);
    if (valid.IsErr()) {
        return Result<BridgeConfig, Error>::Err(std::move(valid).Error());
    }
    return Result<BridgeConfig, Error>::Ok(std::move(config));
}

Result<void, Error> ValidateBridgeConfig(const BridgeConfig& config) {
    if (config.auth_token.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "No auth token: pass --token or set MCP_AUTH_TOKEN"));
    }
    const auto& url = config.control_plane_url;
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Control plane URL must start with http:// or https://, got '" + url + "'"));
    }
    if (config.timeout.count() <= 0) {
        return Result<void, Error>::Err(MakeConfigError("Timeout must be positive"));
    }
    if (config.retry_attempts < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Retry attempts must not be negative"));
    }
    if (config.reconnect_base.count() <= 0 ||
        config.reconnect_cap < config.reconnect_base) {
        return Result<void, Error>::Err(MakeConfigError(
            "Reconnect backoff base must be positive and <= cap"));
    }
    if (!ParseLogLevel(config.log_level).has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid log level: '" + config.log_level + "'"));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_relay
