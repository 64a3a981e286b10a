#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// Result<T, E> — either a value or an error. Expected failures travel as
// values; nothing in the relay throws across a module boundary.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<0>(storage_) : std::move(fallback);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — success carries no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory — the relay's error taxonomy. Every category maps to a
// stable JSON-RPC error code surfaced to the original caller.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    ParseError,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    Internal,
    Unauthorized,
    Forbidden,
    NoOwner,
    ServerBusy,
    Timeout,
    ServerUnavailable,
    TransportFailure,
    Cancelled,
    ToolError,   // the tool server's own JSON-RPC error, passed through
    Config,
};

namespace rpc_code {
constexpr int kParseError        = -32700;
constexpr int kInvalidRequest    = -32600;
constexpr int kMethodNotFound    = -32601;
constexpr int kInvalidParams     = -32602;
constexpr int kInternal          = -32603;
constexpr int kUnauthorized      = -32001;
constexpr int kForbidden         = -32002;
constexpr int kNoOwner           = -32003;
constexpr int kServerBusy        = -32004;
constexpr int kTimeout           = -32005;
constexpr int kServerUnavailable = -32006;
constexpr int kTransportFailure  = -32007;
constexpr int kCancelled         = -32008;
} // namespace rpc_code

// ---------------------------------------------------------------------------
// Error — structured error for relay operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string target;                // server id, tool name or endpoint
    std::optional<int> http_status;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<int> tool_code;      // set for ToolError pass-through

    /// Map an HTTP status returned by the control plane to an Error.
    /// Used by the bridge when the body is not a JSON-RPC envelope.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    [[nodiscard]] int JsonRpcCode() const {
        switch (category) {
            case ErrorCategory::ParseError:        return rpc_code::kParseError;
            case ErrorCategory::InvalidRequest:    return rpc_code::kInvalidRequest;
            case ErrorCategory::MethodNotFound:    return rpc_code::kMethodNotFound;
            case ErrorCategory::InvalidParams:     return rpc_code::kInvalidParams;
            case ErrorCategory::Internal:          return rpc_code::kInternal;
            case ErrorCategory::Unauthorized:      return rpc_code::kUnauthorized;
            case ErrorCategory::Forbidden:         return rpc_code::kForbidden;
            case ErrorCategory::NoOwner:           return rpc_code::kNoOwner;
            case ErrorCategory::ServerBusy:        return rpc_code::kServerBusy;
            case ErrorCategory::Timeout:           return rpc_code::kTimeout;
            case ErrorCategory::ServerUnavailable: return rpc_code::kServerUnavailable;
            case ErrorCategory::TransportFailure:  return rpc_code::kTransportFailure;
            case ErrorCategory::Cancelled:         return rpc_code::kCancelled;
            case ErrorCategory::ToolError:
                return tool_code.value_or(rpc_code::kInternal);
            case ErrorCategory::Config:            return rpc_code::kInternal;
        }
        return rpc_code::kInternal;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::ParseError:        return "parse_error";
            case ErrorCategory::InvalidRequest:    return "invalid_request";
            case ErrorCategory::MethodNotFound:    return "method_not_found";
            case ErrorCategory::InvalidParams:     return "invalid_params";
            case ErrorCategory::Internal:          return "internal";
            case ErrorCategory::Unauthorized:      return "unauthorized";
            case ErrorCategory::Forbidden:         return "forbidden";
            case ErrorCategory::NoOwner:           return "no_owner";
            case ErrorCategory::ServerBusy:        return "server_busy";
            case ErrorCategory::Timeout:           return "timeout";
            case ErrorCategory::ServerUnavailable: return "server_unavailable";
            case ErrorCategory::TransportFailure:  return "transport_failure";
            case ErrorCategory::Cancelled:         return "cancelled";
            case ErrorCategory::ToolError:         return "tool_error";
            case ErrorCategory::Config:            return "config";
        }
        return "internal";
    }

    // Process exit code when an error terminates the executable.
    [[nodiscard]] int ExitCode() const {
        return category == ErrorCategory::Config ? 2 : 1;
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!target.empty()) {
            oss << " [" << target << "]";
        }
        if (http_status.has_value()) {
            oss << " (HTTP " << *http_status << ")";
        }
        oss << ": " << message;
        return oss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               http_status == other.http_status &&
               message == other.message &&
               category == other.category &&
               tool_code == other.tool_code;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

/// Shorthand used throughout the relay to build an Error of a category.
inline Error MakeError(ErrorCategory category,
                       std::string operation,
                       std::string message,
                       std::string target = "") {
    Error e;
    e.operation = std::move(operation);
    e.target = std::move(target);
    e.message = std::move(message);
    e.category = category;
    return e;
}

} // namespace mcp_relay
