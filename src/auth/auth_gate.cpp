#include <mcp_relay/auth/auth_gate.hpp>

#include <mcp_relay/core/log.hpp>

#include <cctype>

namespace mcp_relay {

namespace {

// Compare without early exit so response timing does not leak how much of
// a guessed token matched.
bool ConstantTimeEquals(std::string_view a, std::string_view b) {
    unsigned char diff = static_cast<unsigned char>(a.size() != b.size());
    const std::size_t n = a.size() < b.size() ? a.size() : b.size();
    for (std::size_t i = 0; i < n; ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

Error Unauthorized(const std::string& message) {
    return MakeError(ErrorCategory::Unauthorized, "Authenticate", message);
}

} // anonymous namespace

AuthGate::AuthGate(std::vector<Credential> credentials)
    : credentials_(std::move(credentials)) {}

std::optional<std::string_view> AuthGate::ExtractBearer(std::string_view header) {
    constexpr std::string_view kScheme = "bearer";
    if (header.size() <= kScheme.size()) return std::nullopt;
    for (std::size_t i = 0; i < kScheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(header[i])) != kScheme[i]) {
            return std::nullopt;
        }
    }
    if (header[kScheme.size()] != ' ') return std::nullopt;

    auto token = header.substr(kScheme.size() + 1);
    while (!token.empty() && token.front() == ' ') token.remove_prefix(1);
    while (!token.empty() && token.back() == ' ') token.remove_suffix(1);
    if (token.empty() || token.find(' ') != std::string_view::npos) {
        return std::nullopt;
    }
    return token;
}

std::string AuthGate::Redact(std::string_view token) {
    constexpr std::size_t kVisible = 4;
    if (token.size() <= kVisible) return "...";
    return std::string(token.substr(0, kVisible)) + "...";
}

Result<Principal, Error> AuthGate::Authenticate(
    std::string_view authorization_header) const {
    if (authorization_header.empty()) {
        LogWarn("auth", "Missing authentication token");
        return Result<Principal, Error>::Err(
            Unauthorized("Missing authentication token"));
    }

    auto token = ExtractBearer(authorization_header);
    if (!token.has_value()) {
        LogWarn("auth", "Malformed Authorization header");
        return Result<Principal, Error>::Err(
            Unauthorized("Malformed Authorization header, expected 'Bearer <token>'"));
    }

    const Credential* match = nullptr;
    for (const auto& credential : credentials_) {
        if (ConstantTimeEquals(credential.token, *token)) {
            match = &credential;
        }
    }

    if (match == nullptr) {
        LogWarn("auth", "Invalid token attempted: " + Redact(*token));
        return Result<Principal, Error>::Err(
            Unauthorized("Invalid authentication token"));
    }

    LogDebug("auth", "Token " + Redact(*token) + " resolved to principal '" +
                         match->principal.name + "'");
    return Result<Principal, Error>::Ok(match->principal);
}

Result<std::vector<Credential>, Error> BuildCredentials(
    const std::vector<CredentialConfig>& configs) {
    std::vector<Credential> credentials;
    credentials.reserve(configs.size());
    for (std::size_t i = 0; i < configs.size(); ++i) {
        const auto& config = configs[i];
        if (config.token.empty()) {
            return Result<std::vector<Credential>, Error>::Err(
                MakeError(ErrorCategory::Config, "BuildCredentials",
                          "Credential #" + std::to_string(i + 1) + " has an empty token"));
        }
        Principal principal;
        principal.name = config.principal.empty()
            ? "client-" + std::to_string(i + 1)
            : config.principal;
        principal.permissions.insert(config.permissions.begin(),
                                     config.permissions.end());
        credentials.push_back(Credential{config.token, std::move(principal)});
    }
    return Result<std::vector<Credential>, Error>::Ok(std::move(credentials));
}

} // namespace mcp_relay
