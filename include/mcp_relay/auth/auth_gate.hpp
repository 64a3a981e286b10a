#pragma once

#include <mcp_relay/config/app_config.hpp>
#include <mcp_relay/core/result.hpp>

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// Principal — the identity a credential resolves to. The only identity the
// policy engine and the audit log ever see.
// ---------------------------------------------------------------------------
struct Principal {
    std::string name;
    std::set<std::string> permissions;

    [[nodiscard]] bool HasPermission(const std::string& permission) const {
        return permissions.count(permission) > 0;
    }
};

struct Credential {
    std::string token;
    Principal principal;
};

// ---------------------------------------------------------------------------
// AuthGate — validates bearer credentials. Stateless beyond the immutable
// credential table; nothing about a caller outlives the call being checked.
// ---------------------------------------------------------------------------
class AuthGate {
public:
    explicit AuthGate(std::vector<Credential> credentials);

    /// Validate an `Authorization` header value ("Bearer <token>").
    /// Missing, malformed and unknown credentials are Unauthorized.
    [[nodiscard]] Result<Principal, Error> Authenticate(
        std::string_view authorization_header) const;

    [[nodiscard]] std::size_t CredentialCount() const noexcept {
        return credentials_.size();
    }

    /// "Bearer abc" -> "abc". Scheme match is case-insensitive.
    [[nodiscard]] static std::optional<std::string_view> ExtractBearer(
        std::string_view header);

    /// First characters of a token followed by "...", for logs.
    [[nodiscard]] static std::string Redact(std::string_view token);

private:
    std::vector<Credential> credentials_;
};

/// Turn configured credentials into gate entries. Tokens must already be
/// resolved (see ResolveTokenEnv); empty tokens are rejected.
[[nodiscard]] Result<std::vector<Credential>, Error> BuildCredentials(
    const std::vector<CredentialConfig>& configs);

} // namespace mcp_relay
