#pragma once

#include <mcp_relay/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_relay {

constexpr const char* kProtocolVersion = "2025-06-18";

// ---------------------------------------------------------------------------
// Method — the closed set of MCP methods the relay understands. Everything
// else is MethodNotFound; dispatch goes through tables keyed by this enum.
// ---------------------------------------------------------------------------
enum class Method {
    Initialize,
    Initialized,      // notifications/initialized
    ToolsList,
    ToolsCall,
    ResourcesList,
    PromptsList,
    Ping,
};

[[nodiscard]] std::optional<Method> ParseMethod(std::string_view name);
[[nodiscard]] const char* MethodName(Method method);

// ---------------------------------------------------------------------------
// Envelope — a classified JSON-RPC 2.0 message.
// ---------------------------------------------------------------------------
struct Envelope {
    enum class Kind {
        Request,       // has method and id
        Notification,  // has method, no id
        Response,      // has id and result or error, no method
    };

    Kind kind = Kind::Request;
    nlohmann::json id;                               // null for notifications
    std::string method;
    nlohmann::json params = nlohmann::json::object();
    nlohmann::json result;                           // Response only
    std::optional<nlohmann::json> error;             // Response only

    [[nodiscard]] bool IsErrorResponse() const { return error.has_value(); }
};

// A message that could not be classified. `id` is the request id when one
// could be recovered, null otherwise.
struct RejectedEnvelope {
    nlohmann::json id;
    Error error;
};

/// Parse one line of newline-delimited JSON-RPC. Malformed JSON yields a
/// ParseError; a well-formed but invalid message yields InvalidRequest.
[[nodiscard]] Result<Envelope, RejectedEnvelope> ParseEnvelope(std::string_view line);

/// Classify an already-parsed JSON value.
[[nodiscard]] Result<Envelope, RejectedEnvelope> ClassifyMessage(const nlohmann::json& message);

// -- Builders ---------------------------------------------------------------

[[nodiscard]] nlohmann::json MakeRequest(const nlohmann::json& id,
                                         std::string_view method,
                                         const nlohmann::json& params);
[[nodiscard]] nlohmann::json MakeNotification(std::string_view method,
                                              const nlohmann::json& params);
[[nodiscard]] nlohmann::json MakeResult(const nlohmann::json& id,
                                        const nlohmann::json& result);
[[nodiscard]] nlohmann::json MakeErrorResponse(const nlohmann::json& id,
                                               int code,
                                               const std::string& message);
/// Error response for a relay Error; the category is attached as `data`.
[[nodiscard]] nlohmann::json MakeErrorResponse(const nlohmann::json& id,
                                               const Error& error);

/// Convert a JSON-RPC `error` object received from a peer back into an
/// Error. Relay codes map back to their category; anything else is a
/// ToolError carrying the peer's code.
[[nodiscard]] Error ErrorFromRpc(const nlohmann::json& error_object,
                                 const std::string& operation,
                                 const std::string& target);

/// True when `text` is valid UTF-8 and can be carried in a JSON string.
/// Header and query values arrive as raw bytes.
[[nodiscard]] bool IsValidUtf8(std::string_view text);

/// Serialize for the wire; invalid UTF-8 that slipped into a string is
/// replaced with U+FFFD instead of throwing.
[[nodiscard]] std::string DumpForWire(const nlohmann::json& message);

} // namespace mcp_relay
