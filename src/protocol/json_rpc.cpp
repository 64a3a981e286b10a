#include <mcp_relay/protocol/json_rpc.hpp>

#include <array>
#include <utility>

namespace mcp_relay {

namespace {

struct MethodEntry {
    Method method;
    const char* name;
};

constexpr std::array<MethodEntry, 7> kMethods = {{
    {Method::Initialize,    "initialize"},
    {Method::Initialized,   "notifications/initialized"},
    {Method::ToolsList,     "tools/list"},
    {Method::ToolsCall,     "tools/call"},
    {Method::ResourcesList, "resources/list"},
    {Method::PromptsList,   "prompts/list"},
    {Method::Ping,          "ping"},
}};

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number_integer() ||
           id.is_number_unsigned() || id.is_null();
}

RejectedEnvelope Reject(nlohmann::json id, ErrorCategory category,
                        const std::string& message) {
    return RejectedEnvelope{
        std::move(id), MakeError(category, "ParseEnvelope", message)};
}

} // anonymous namespace

std::optional<Method> ParseMethod(std::string_view name) {
    for (const auto& entry : kMethods) {
        if (name == entry.name) return entry.method;
    }
    return std::nullopt;
}

const char* MethodName(Method method) {
    for (const auto& entry : kMethods) {
        if (entry.method == method) return entry.name;
    }
    return "";
}

Result<Envelope, RejectedEnvelope> ParseEnvelope(std::string_view line) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error&) {
        return Result<Envelope, RejectedEnvelope>::Err(
            Reject(nullptr, ErrorCategory::ParseError, "Parse error"));
    }
    return ClassifyMessage(message);
}

Result<Envelope, RejectedEnvelope> ClassifyMessage(const nlohmann::json& message) {
    using R = Result<Envelope, RejectedEnvelope>;

    if (!message.is_object()) {
        return R::Err(Reject(nullptr, ErrorCategory::InvalidRequest,
                             "Invalid Request"));
    }

    const bool has_id = message.contains("id");
    nlohmann::json id = has_id ? message["id"] : nlohmann::json(nullptr);
    if (!IsValidId(id)) {
        return R::Err(Reject(nullptr, ErrorCategory::InvalidRequest,
                             "Invalid Request: id must be a string or integer"));
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        return R::Err(Reject(id, ErrorCategory::InvalidRequest,
                             "Invalid Request: jsonrpc must be \"2.0\""));
    }

    Envelope envelope;
    envelope.id = id;

    auto method = message.find("method");
    if (method != message.end()) {
        if (!method->is_string()) {
            return R::Err(Reject(id, ErrorCategory::InvalidRequest,
                                 "Invalid Request: method must be a string"));
        }
        envelope.method = method->get<std::string>();
        envelope.kind = has_id ? Envelope::Kind::Request
                               : Envelope::Kind::Notification;
        auto params = message.find("params");
        if (params != message.end() && !params->is_null()) {
            if (!params->is_object() && !params->is_array()) {
                return R::Err(Reject(id, ErrorCategory::InvalidRequest,
                                     "Invalid Request: params must be structured"));
            }
            envelope.params = *params;
        }
        return R::Ok(std::move(envelope));
    }

    if (has_id && (message.contains("result") || message.contains("error"))) {
        envelope.kind = Envelope::Kind::Response;
        if (message.contains("error") && !message["error"].is_null()) {
            envelope.error = message["error"];
        } else {
            envelope.result = message.value("result", nlohmann::json(nullptr));
        }
        return R::Ok(std::move(envelope));
    }

    return R::Err(Reject(id, ErrorCategory::InvalidRequest,
                         "Invalid Request: missing method"));
}

nlohmann::json MakeRequest(const nlohmann::json& id,
                           std::string_view method,
                           const nlohmann::json& params) {
    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", std::string(method)},
    };
    if (!params.is_null() && !params.empty()) {
        request["params"] = params;
    }
    return request;
}

nlohmann::json MakeNotification(std::string_view method,
                                const nlohmann::json& params) {
    nlohmann::json notification = {
        {"jsonrpc", "2.0"},
        {"method", std::string(method)},
    };
    if (!params.is_null() && !params.empty()) {
        notification["params"] = params;
    }
    return notification;
}

nlohmann::json MakeResult(const nlohmann::json& id,
                          const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeErrorResponse(const nlohmann::json& id,
                                 int code,
                                 const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json MakeErrorResponse(const nlohmann::json& id, const Error& error) {
    auto response = MakeErrorResponse(id, error.JsonRpcCode(), error.message);
    if (error.category != ErrorCategory::ToolError) {
        response["error"]["data"] = {{"category", error.CategoryName()}};
        if (!error.target.empty()) {
            response["error"]["data"]["target"] = error.target;
        }
    }
    return response;
}

Error ErrorFromRpc(const nlohmann::json& error_object,
                   const std::string& operation,
                   const std::string& target) {
    int code = rpc_code::kInternal;
    std::string message = "Unknown error";
    if (error_object.is_object()) {
        if (error_object.contains("code") && error_object["code"].is_number_integer()) {
            code = error_object["code"].get<int>();
        }
        if (error_object.contains("message") && error_object["message"].is_string()) {
            message = error_object["message"].get<std::string>();
        }
    }

    ErrorCategory category;
    switch (code) {
        case rpc_code::kParseError:        category = ErrorCategory::ParseError; break;
        case rpc_code::kInvalidRequest:    category = ErrorCategory::InvalidRequest; break;
        case rpc_code::kMethodNotFound:    category = ErrorCategory::MethodNotFound; break;
        case rpc_code::kInvalidParams:     category = ErrorCategory::InvalidParams; break;
        case rpc_code::kUnauthorized:      category = ErrorCategory::Unauthorized; break;
        case rpc_code::kForbidden:         category = ErrorCategory::Forbidden; break;
        case rpc_code::kNoOwner:           category = ErrorCategory::NoOwner; break;
        case rpc_code::kServerBusy:        category = ErrorCategory::ServerBusy; break;
        case rpc_code::kTimeout:           category = ErrorCategory::Timeout; break;
        case rpc_code::kServerUnavailable: category = ErrorCategory::ServerUnavailable; break;
        case rpc_code::kTransportFailure:  category = ErrorCategory::TransportFailure; break;
        case rpc_code::kCancelled:         category = ErrorCategory::Cancelled; break;
        default:                           category = ErrorCategory::ToolError; break;
    }

    auto error = MakeError(category, operation, message, target);
    if (category == ErrorCategory::ToolError) {
        error.tool_code = code;
    }
    return error;
}

bool IsValidUtf8(std::string_view text) {
    try {
        (void)nlohmann::json(std::string(text)).dump();
        return true;
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

std::string DumpForWire(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mcp_relay
