#include <catch2/catch_test_macros.hpp>

#include <mcp_relay/auth/auth_gate.hpp>

#include <string>
#include <vector>

using namespace mcp_relay;

namespace {

AuthGate MakeGate() {
    std::vector<CredentialConfig> configs(2);
    configs[0].token = "alpha-token";
    configs[0].principal = "alice";
    configs[0].permissions = {"tools", "admin"};
    configs[1].token = "beta-token";
    auto credentials = BuildCredentials(configs);
    REQUIRE(credentials.IsOk());
    return AuthGate(std::move(credentials).Value());
}

} // anonymous namespace

// ===========================================================================
// ExtractBearer
// ===========================================================================

TEST_CASE("ExtractBearer: well-formed header", "[auth]") {
    CHECK(AuthGate::ExtractBearer("Bearer abc") == std::optional<std::string_view>("abc"));
    CHECK(AuthGate::ExtractBearer("bearer abc") == std::optional<std::string_view>("abc"));
    CHECK(AuthGate::ExtractBearer("BEARER  abc ") == std::optional<std::string_view>("abc"));
}

TEST_CASE("ExtractBearer: malformed headers", "[auth]") {
    CHECK_FALSE(AuthGate::ExtractBearer("Bearer").has_value());
    CHECK_FALSE(AuthGate::ExtractBearer("Bearer ").has_value());
    CHECK_FALSE(AuthGate::ExtractBearer("Basic dXNlcjpwYXNz").has_value());
    CHECK_FALSE(AuthGate::ExtractBearer("Bearerabc").has_value());
    CHECK_FALSE(AuthGate::ExtractBearer("Bearer a b").has_value());
}

TEST_CASE("Redact: shows only a prefix", "[auth]") {
    CHECK(AuthGate::Redact("supersecret") == "supe...");
    CHECK(AuthGate::Redact("abc") == "...");
}

// ===========================================================================
// Authenticate
// ===========================================================================

TEST_CASE("Authenticate: valid token resolves principal", "[auth]") {
    auto gate = MakeGate();
    auto principal = gate.Authenticate("Bearer alpha-token");
    REQUIRE(principal.IsOk());
    CHECK(principal.Value().name == "alice");
    CHECK(principal.Value().HasPermission("tools"));
    CHECK(principal.Value().HasPermission("admin"));
    CHECK_FALSE(principal.Value().HasPermission("root"));
}

TEST_CASE("Authenticate: unnamed credential gets a generated name", "[auth]") {
    auto gate = MakeGate();
    auto principal = gate.Authenticate("Bearer beta-token");
    REQUIRE(principal.IsOk());
    CHECK(principal.Value().name == "client-2");
    CHECK(principal.Value().permissions.empty());
}

TEST_CASE("Authenticate: missing header", "[auth]") {
    auto gate = MakeGate();
    auto result = gate.Authenticate("");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Unauthorized);
    CHECK(result.Error().JsonRpcCode() == -32001);
}

TEST_CASE("Authenticate: unknown token", "[auth]") {
    auto gate = MakeGate();
    auto result = gate.Authenticate("Bearer alpha-token-but-longer");
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid authentication token");
}

TEST_CASE("Authenticate: prefix of a valid token is rejected", "[auth]") {
    auto gate = MakeGate();
    CHECK(gate.Authenticate("Bearer alpha").IsErr());
}

TEST_CASE("Authenticate: wrong scheme", "[auth]") {
    auto gate = MakeGate();
    auto result = gate.Authenticate("Token alpha-token");
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Malformed") != std::string::npos);
}

TEST_CASE("Authenticate: empty gate rejects everything", "[auth]") {
    AuthGate gate({});
    CHECK(gate.CredentialCount() == 0);
    CHECK(gate.Authenticate("Bearer anything").IsErr());
}

// ===========================================================================
// BuildCredentials
// ===========================================================================

TEST_CASE("BuildCredentials: empty token is a config error", "[auth]") {
    std::vector<CredentialConfig> configs(1);
    configs[0].token_env = "UNRESOLVED";
    auto result = BuildCredentials(configs);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}
