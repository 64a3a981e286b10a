#pragma once

#include <mcp_relay/config/app_config.hpp>
#include <mcp_relay/core/result.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_relay {

// Environment access, injectable for tests.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

[[nodiscard]] EnvLookup ProcessEnvironment();

// Parse YAML text into a ControlPlaneConfig. No env resolution, no validation.
[[nodiscard]] Result<ControlPlaneConfig, Error> ParseControlPlaneYaml(
    std::string_view yaml_text);

// Read and parse a YAML config file.
[[nodiscard]] Result<ControlPlaneConfig, Error> LoadControlPlaneConfig(
    std::string_view file_path);

// Minimal config from MCP_HOST, MCP_PORT, MCP_LOG_LEVEL and MCP_AUTH_TOKENS
// (comma-separated). Used when no config file is given or found.
[[nodiscard]] Result<ControlPlaneConfig, Error> LoadControlPlaneFromEnv(
    const EnvLookup& env);

// First existing file among the conventional config locations.
[[nodiscard]] std::optional<std::string> FindDefaultConfigFile(const EnvLookup& env);

// Resolve token_env: credentials without an inline token read it from the
// named environment variable.
[[nodiscard]] Result<ControlPlaneConfig, Error> ResolveTokenEnv(
    ControlPlaneConfig config, const EnvLookup& env);

// Validate required fields and value ranges.
[[nodiscard]] Result<void, Error> ValidateControlPlaneConfig(
    const ControlPlaneConfig& config);

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

struct ServeCliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool json_logs = false;
};

// Parse `serve` flags. argv[0] is the program name, the subcommand already
// stripped.
[[nodiscard]] Result<ServeCliOptions, Error> ParseServeCli(int argc,
                                                           const char* const* argv);

// CLI flags take precedence over file/env values.
[[nodiscard]] ControlPlaneConfig ApplyServeOverrides(ControlPlaneConfig config,
                                                     const ServeCliOptions& cli);

// Parse `bridge` flags with environment fallbacks (MCP_CONTROL_PLANE_URL,
// MCP_AUTH_TOKEN). A missing token is a configuration error.
[[nodiscard]] Result<BridgeConfig, Error> LoadBridgeConfig(int argc,
                                                           const char* const* argv,
                                                           const EnvLookup& env);

[[nodiscard]] Result<void, Error> ValidateBridgeConfig(const BridgeConfig& config);

} // namespace mcp_relay
