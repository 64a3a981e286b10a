#include <catch2/catch_test_macros.hpp>

#include <mcp_relay/config/config_loader.hpp>

#include <map>
#include <string>
#include <vector>

using namespace mcp_relay;

namespace {

// Tests run from the build directory; derive the testdata path from this file.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

ControlPlaneConfig ValidConfig() {
    ControlPlaneConfig config;
    CredentialConfig credential;
    credential.token = "t";
    config.credentials.push_back(credential);
    ServerDescriptor d;
    d.id = "echo";
    d.command = {"/bin/echo-server"};
    config.mcp_servers.push_back(d);
    return config;
}

} // anonymous namespace

// ===========================================================================
// LoadControlPlaneConfig
// ===========================================================================

TEST_CASE("LoadControlPlaneConfig: full config", "[config][yaml]") {
    auto result = LoadControlPlaneConfig(TestDataPath("control_plane_full.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.host == "127.0.0.1");
    CHECK(config.server.port == 9100);
    CHECK(config.server.threads == 4);
    CHECK(config.server.log_level == "debug");
    CHECK(config.server.json_logs);

    REQUIRE(config.credentials.size() == 2);
    CHECK(config.credentials[0].token == "admin-secret");
    CHECK(config.credentials[0].principal == "admin");
    CHECK(config.credentials[0].permissions == std::vector<std::string>{"admin", "tools"});
    CHECK(config.credentials[1].token.empty());
    REQUIRE(config.credentials[1].token_env.has_value());
    CHECK(*config.credentials[1].token_env == "RELAY_CI_TOKEN");

    CHECK(config.has_policy);
    REQUIRE(config.policy.size() == 3);
    CHECK(config.policy[1].principal == "perm:tools");
    CHECK(config.policy[1].resource == "fs_*");
    CHECK(config.policy[1].when.at("mode") == "read");
    CHECK(config.policy[2].resource == "*");

    REQUIRE(config.mcp_servers.size() == 2);
    const auto& fs = config.mcp_servers[0];
    CHECK(fs.id == "filesystem");
    CHECK(fs.name == "Filesystem");
    CHECK(fs.type == ServerType::Npx);
    CHECK(fs.Argv() == std::vector<std::string>{
              "npx", "-y", "@modelcontextprotocol/server-filesystem", "/srv/data"});
    CHECK(fs.env.at("NODE_ENV") == "production");
    REQUIRE(fs.working_dir.has_value());
    CHECK(*fs.working_dir == "/srv");
    CHECK(fs.health_check_interval == std::chrono::milliseconds(5000));
    CHECK(fs.startup_timeout == std::chrono::milliseconds(15000));
    CHECK(fs.call_timeout == std::chrono::milliseconds(20000));
    CHECK(fs.backoff_base == std::chrono::milliseconds(250));
    CHECK(fs.backoff_cap == std::chrono::milliseconds(8000));
    CHECK(fs.max_restart_attempts == 3);
    CHECK(fs.queue_capacity == 8);
    CHECK(fs.max_in_flight == 2);

    const auto& search = config.mcp_servers[1];
    CHECK(search.name == "search");  // defaults to id
    CHECK(search.type == ServerType::Python);
    CHECK(search.command == std::vector<std::string>{"python3"});
    CHECK(search.startup_timeout == std::chrono::seconds(10));
    CHECK_FALSE(search.enabled);
    CHECK_FALSE(search.restart_on_failure);
}

TEST_CASE("LoadControlPlaneConfig: minimal config uses defaults", "[config][yaml]") {
    auto result = LoadControlPlaneConfig(TestDataPath("control_plane_minimal.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 8444);
    CHECK_FALSE(config.has_policy);
    REQUIRE(config.credentials.size() == 1);
    CHECK(config.credentials[0].token == "token-one");
    REQUIRE(config.mcp_servers.size() == 1);
    CHECK(config.mcp_servers[0].type == ServerType::Binary);
    CHECK(config.mcp_servers[0].max_in_flight == 1);
    CHECK(config.mcp_servers[0].restart_on_failure);
    CHECK(ValidateControlPlaneConfig(config).IsOk());
}

TEST_CASE("LoadControlPlaneConfig: nonexistent file", "[config][yaml]") {
    auto result = LoadControlPlaneConfig("/nonexistent/path/control_plane.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().ExitCode() == 2);
    CHECK(result.Error().target == "/nonexistent/path/control_plane.yaml");
}

TEST_CASE("LoadControlPlaneConfig: unknown server type", "[config][yaml]") {
    auto result = LoadControlPlaneConfig(TestDataPath("control_plane_bad_type.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("ruby") != std::string::npos);
}

// ===========================================================================
// ParseControlPlaneYaml
// ===========================================================================

TEST_CASE("ParseControlPlaneYaml: empty document", "[config][yaml]") {
    auto result = ParseControlPlaneYaml("");
    REQUIRE(result.IsOk());
    CHECK(result.Value().mcp_servers.empty());
}

TEST_CASE("ParseControlPlaneYaml: malformed YAML", "[config][yaml]") {
    auto result = ParseControlPlaneYaml("server: [unclosed");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("ParseControlPlaneYaml: port out of range", "[config][yaml]") {
    auto result = ParseControlPlaneYaml("server:\n  port: 70000\n");
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("65535") != std::string::npos);
}

TEST_CASE("ParseControlPlaneYaml: server without id", "[config][yaml]") {
    auto result = ParseControlPlaneYaml("mcp_servers:\n  - command: foo\n");
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("'id'") != std::string::npos);
}

TEST_CASE("ParseControlPlaneYaml: workers is accepted for threads", "[config][yaml]") {
    auto result = ParseControlPlaneYaml("server:\n  workers: 3\n");
    REQUIRE(result.IsOk());
    CHECK(result.Value().server.threads == 3);
}

TEST_CASE("ParseControlPlaneYaml: empty policy section still counts", "[config][yaml]") {
    auto result = ParseControlPlaneYaml("policy: []\n");
    REQUIRE(result.IsOk());
    CHECK(result.Value().has_policy);
    CHECK(result.Value().policy.empty());
}

// ===========================================================================
// Environment
// ===========================================================================

TEST_CASE("LoadControlPlaneFromEnv: reads host, port, level and tokens", "[config][env]") {
    auto result = LoadControlPlaneFromEnv(FakeEnv({
        {"MCP_HOST", "10.0.0.5"},
        {"MCP_PORT", "9000"},
        {"MCP_LOG_LEVEL", "warn"},
        {"MCP_AUTH_TOKENS", "alpha, beta,,gamma "},
    }));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.server.host == "10.0.0.5");
    CHECK(config.server.port == 9000);
    CHECK(config.server.log_level == "warn");
    REQUIRE(config.credentials.size() == 3);
    CHECK(config.credentials[0].token == "alpha");
    CHECK(config.credentials[1].token == "beta");
    CHECK(config.credentials[2].token == "gamma");
}

TEST_CASE("LoadControlPlaneFromEnv: invalid port", "[config][env]") {
    auto result = LoadControlPlaneFromEnv(FakeEnv({{"MCP_PORT", "80x"}}));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("ResolveTokenEnv: fills token from environment", "[config][env]") {
    auto loaded = LoadControlPlaneConfig(TestDataPath("control_plane_full.yaml"));
    REQUIRE(loaded.IsOk());
    auto result = ResolveTokenEnv(loaded.Value(), FakeEnv({{"RELAY_CI_TOKEN", "ci-secret"}}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().credentials[0].token == "admin-secret");
    CHECK(result.Value().credentials[1].token == "ci-secret");
}

TEST_CASE("ResolveTokenEnv: missing variable", "[config][env]") {
    auto loaded = LoadControlPlaneConfig(TestDataPath("control_plane_full.yaml"));
    REQUIRE(loaded.IsOk());
    auto result = ResolveTokenEnv(loaded.Value(), FakeEnv({}));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("RELAY_CI_TOKEN") != std::string::npos);
}

TEST_CASE("FindDefaultConfigFile: nothing found", "[config][env]") {
    // HOME points somewhere without .mcp; the relative candidates do not
    // exist in the build directory.
    auto found = FindDefaultConfigFile(FakeEnv({{"HOME", "/nonexistent-home"}}));
    if (found.has_value()) {
        CHECK(*found != "/nonexistent-home/.mcp/control_plane.yaml");
    }
}

// ===========================================================================
// ValidateControlPlaneConfig
// ===========================================================================

TEST_CASE("ValidateControlPlaneConfig: valid", "[config][validate]") {
    CHECK(ValidateControlPlaneConfig(ValidConfig()).IsOk());
}

TEST_CASE("ValidateControlPlaneConfig: requires a credential", "[config][validate]") {
    auto config = ValidConfig();
    config.credentials.clear();
    CHECK(ValidateControlPlaneConfig(config).IsErr());
}

TEST_CASE("ValidateControlPlaneConfig: duplicate server ids", "[config][validate]") {
    auto config = ValidConfig();
    config.mcp_servers.push_back(config.mcp_servers[0]);
    auto result = ValidateControlPlaneConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Duplicate") != std::string::npos);
}

TEST_CASE("ValidateControlPlaneConfig: empty command", "[config][validate]") {
    auto config = ValidConfig();
    config.mcp_servers[0].command.clear();
    CHECK(ValidateControlPlaneConfig(config).IsErr());
}

TEST_CASE("ValidateControlPlaneConfig: backoff cap below base", "[config][validate]") {
    auto config = ValidConfig();
    config.mcp_servers[0].backoff_base = std::chrono::milliseconds(5000);
    config.mcp_servers[0].backoff_cap = std::chrono::milliseconds(1000);
    CHECK(ValidateControlPlaneConfig(config).IsErr());
}

TEST_CASE("ValidateControlPlaneConfig: zero queue capacity", "[config][validate]") {
    auto config = ValidConfig();
    config.mcp_servers[0].queue_capacity = 0;
    CHECK(ValidateControlPlaneConfig(config).IsErr());
}

TEST_CASE("ValidateControlPlaneConfig: bad policy effect", "[config][validate]") {
    auto config = ValidConfig();
    PolicyRuleConfig rule;
    rule.effect = "maybe";
    config.policy.push_back(rule);
    CHECK(ValidateControlPlaneConfig(config).IsErr());
}

TEST_CASE("ValidateControlPlaneConfig: bad log level", "[config][validate]") {
    auto config = ValidConfig();
    config.server.log_level = "loud";
    CHECK(ValidateControlPlaneConfig(config).IsErr());
}

// ===========================================================================
// serve command line
// ===========================================================================

TEST_CASE("ParseServeCli: flags", "[config][cli]") {
    const char* argv[] = {"mcp-relay", "--config", "relay.yaml", "--host", "::1",
                          "--port", "9200", "--log-level", "debug", "--json-logs"};
    auto result = ParseServeCli(10, argv);
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.config_path == std::optional<std::string>("relay.yaml"));
    CHECK(cli.host == std::optional<std::string>("::1"));
    CHECK(cli.port == std::optional<uint16_t>(9200));
    CHECK(cli.log_level == std::optional<std::string>("debug"));
    CHECK(cli.json_logs);
}

TEST_CASE("ParseServeCli: no flags", "[config][cli]") {
    const char* argv[] = {"mcp-relay"};
    auto result = ParseServeCli(1, argv);
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().config_path.has_value());
    CHECK_FALSE(result.Value().json_logs);
}

TEST_CASE("ParseServeCli: port out of range", "[config][cli]") {
    const char* argv[] = {"mcp-relay", "--port", "0"};
    auto result = ParseServeCli(3, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("ParseServeCli: unknown flag", "[config][cli]") {
    const char* argv[] = {"mcp-relay", "--frobnicate"};
    CHECK(ParseServeCli(2, argv).IsErr());
}

TEST_CASE("ApplyServeOverrides: CLI wins over file", "[config][cli]") {
    auto config = ValidConfig();
    config.server.port = 1234;
    ServeCliOptions cli;
    cli.port = 4321;
    cli.log_level = "error";
    auto merged = ApplyServeOverrides(config, cli);
    CHECK(merged.server.port == 4321);
    CHECK(merged.server.log_level == "error");
    CHECK(merged.server.host == "0.0.0.0");
}

// ===========================================================================
// bridge command line
// ===========================================================================

TEST_CASE("LoadBridgeConfig: flags", "[config][bridge]") {
    const char* argv[] = {"mcp-relay", "--url", "https://relay.internal:9443/base",
                          "--token", "abc", "--timeout", "5", "--retry-attempts", "7",
                          "--workers", "2"};
    auto result = LoadBridgeConfig(11, argv, FakeEnv({}));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.control_plane_url == "https://relay.internal:9443/base");
    CHECK(config.auth_token == "abc");
    CHECK(config.timeout == std::chrono::seconds(5));
    CHECK(config.retry_attempts == 7);
    CHECK(config.workers == 2);
}

TEST_CASE("LoadBridgeConfig: environment fallbacks", "[config][bridge]") {
    const char* argv[] = {"mcp-relay"};
    auto result = LoadBridgeConfig(1, argv, FakeEnv({
        {"MCP_CONTROL_PLANE_URL", "http://cp:8444"},
        {"MCP_AUTH_TOKEN", "from-env"},
        {"MCP_LOG_LEVEL", "debug"},
    }));
    REQUIRE(result.IsOk());
    CHECK(result.Value().control_plane_url == "http://cp:8444");
    CHECK(result.Value().auth_token == "from-env");
    CHECK(result.Value().log_level == "debug");
}

TEST_CASE("LoadBridgeConfig: flag beats environment", "[config][bridge]") {
    const char* argv[] = {"mcp-relay", "--token", "flag"};
    auto result = LoadBridgeConfig(3, argv, FakeEnv({{"MCP_AUTH_TOKEN", "env"}}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().auth_token == "flag");
}

TEST_CASE("LoadBridgeConfig: missing token is a config error", "[config][bridge]") {
    const char* argv[] = {"mcp-relay"};
    auto result = LoadBridgeConfig(1, argv, FakeEnv({}));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadBridgeConfig: URL scheme is checked", "[config][bridge]") {
    const char* argv[] = {"mcp-relay", "--url", "ftp://cp", "--token", "t"};
    CHECK(LoadBridgeConfig(5, argv, FakeEnv({})).IsErr());
}

TEST_CASE("LoadBridgeConfig: zero workers", "[config][bridge]") {
    const char* argv[] = {"mcp-relay", "--token", "t", "--workers", "0"};
    CHECK(LoadBridgeConfig(5, argv, FakeEnv({})).IsErr());
}
