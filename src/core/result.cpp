#include <mcp_relay/core/result.hpp>

namespace mcp_relay {

namespace {

// Bodies are only attached when short and printable; an HTML error page from
// a reverse proxy is not worth surfacing to the AI client.
std::optional<std::string> ShortDetail(const std::string& body) {
    constexpr size_t kMaxDetail = 200;
    if (body.empty() || body.size() > kMaxDetail) return std::nullopt;
    for (char c : body) {
        if (static_cast<unsigned char>(c) < 0x20 && c != '\n' && c != '\t') {
            return std::nullopt;
        }
    }
    if (body.front() == '<') return std::nullopt;
    return body;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto detail = ShortDetail(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::InvalidRequest;
            message = "Bad request";
            break;
        case 401:
            category = ErrorCategory::Unauthorized;
            message = "Unauthorized: missing or invalid bearer token";
            break;
        case 403:
            category = ErrorCategory::Forbidden;
            message = "Forbidden: policy denies this action";
            break;
        case 404:
            category = ErrorCategory::MethodNotFound;
            message = "Control plane endpoint not found";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Control plane request timed out";
            break;
        case 429:
            category = ErrorCategory::ServerBusy;
            message = "Control plane busy, retry later";
            break;
        case 502:
        case 503:
            category = ErrorCategory::TransportFailure;
            message = "Control plane unavailable";
            break;
        default:
            category = ErrorCategory::Internal;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    if (detail.has_value()) {
        message += " (" + *detail + ")";
    }

    Error error;
    error.operation = operation;
    error.target = endpoint;
    error.http_status = status_code;
    error.message = std::move(message);
    error.category = category;
    return error;
}

} // namespace mcp_relay
