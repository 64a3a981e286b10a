#include <mcp_relay/server/control_plane_service.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/core/version.hpp>

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <utility>

namespace mcp_relay {

namespace {

std::string UtcTimestamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Header and query values are raw bytes; they end up in JSON replies and
// session keys, so they must be valid UTF-8.
std::optional<Error> CheckRequestText(const ServiceRequest& request, std::string_view operation) {
    if (request.request_id && !IsValidUtf8(*request.request_id)) {
        return MakeError(ErrorCategory::InvalidRequest, std::string(operation),
                         "Invalid Request: request_id is not valid UTF-8");
    }
    if (!IsValidUtf8(request.session)) {
        return MakeError(ErrorCategory::InvalidRequest, std::string(operation),
                         "Invalid Request: X-MCP-Session is not valid UTF-8");
    }
    return std::nullopt;
}

// Calls without an X-MCP-Session header share one session per principal.
std::string SessionOf(const Principal& principal, const ServiceRequest& request) {
    return request.session.empty() ? "principal:" + principal.name : request.session;
}

} // anonymous namespace

int HttpStatusFor(const Error& error) {
    switch (error.category) {
        case ErrorCategory::Unauthorized:   return 401;
        case ErrorCategory::Forbidden:      return 403;
        case ErrorCategory::ParseError:
        case ErrorCategory::InvalidRequest: return 400;
        default:                            return 200;
    }
}

ControlPlaneService::ControlPlaneService(const AuthGate& gate,
                                         const PolicyEngine& policy,
                                         RequestRouter& router,
                                         LifecycleManager& lifecycle)
    : gate_(gate), policy_(policy), router_(router), lifecycle_(lifecycle) {}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

ControlPlaneService::Handler ControlPlaneService::HandlerFor(Method method) {
    static const std::array<std::pair<Method, Handler>, 5> kHandlers = {{
        {Method::Initialize,    &ControlPlaneService::HandleInitialize},
        {Method::ToolsList,     &ControlPlaneService::HandleToolsList},
        {Method::ToolsCall,     &ControlPlaneService::HandleToolsCall},
        {Method::ResourcesList, &ControlPlaneService::HandleResourcesList},
        {Method::PromptsList,   &ControlPlaneService::HandlePromptsList},
    }};
    for (const auto& [m, handler] : kHandlers) {
        if (m == method) return handler;
    }
    return nullptr;
}

ServiceResponse ControlPlaneService::Handle(Method method, const ServiceRequest& request) {
    if (auto bad = CheckRequestText(request, MethodName(method))) {
        return Fail(nullptr, *bad);
    }
    nlohmann::json id = request.request_id ? nlohmann::json(*request.request_id)
                                           : nlohmann::json(nullptr);

    auto principal = gate_.Authenticate(request.authorization);
    if (principal.IsErr()) {
        return Fail(id, principal.Error());
    }

    nlohmann::json params = nlohmann::json::object();
    if (method == Method::Initialize || method == Method::ToolsCall) {
        auto parsed = ParseEnvelope(request.body);
        if (parsed.IsErr()) {
            const auto& rejected = parsed.Error();
            return Fail(rejected.id, rejected.error);
        }
        const auto& envelope = parsed.Value();
        if (envelope.kind != Envelope::Kind::Request) {
            return Fail(envelope.id, MakeError(ErrorCategory::InvalidRequest,
                                               MethodName(method),
                                               "Invalid Request: expected a request"));
        }
        if (envelope.method != MethodName(method)) {
            return Fail(envelope.id, MakeError(ErrorCategory::InvalidRequest,
                                               MethodName(method),
                                               "Invalid Request: method '" + envelope.method +
                                                   "' not accepted at this endpoint"));
        }
        id = envelope.id;
        params = envelope.params;
    }

    auto handler = HandlerFor(method);
    if (handler == nullptr) {
        return Fail(id, MakeError(ErrorCategory::MethodNotFound, MethodName(method),
                                  "Method not found"));
    }
    return (this->*handler)(principal.Value(), request, id, params);
}

// ---------------------------------------------------------------------------
// Method handlers
// ---------------------------------------------------------------------------

ServiceResponse ControlPlaneService::HandleInitialize(const Principal& principal,
                                                      const ServiceRequest& request,
                                                      const nlohmann::json& id,
                                                      const nlohmann::json& /*params*/) {
    if (auto denied = Authorize(principal, "initialize", "*", request, {}, id)) {
        return *denied;
    }
    LogInfo("service", "initialize from '" + principal.name + "'");
    nlohmann::json result = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {
            {"tools", nlohmann::json::object()},
            {"resources", nlohmann::json::object()},
            {"prompts", nlohmann::json::object()},
        }},
        {"serverInfo", {{"name", "mcp-relay"}, {"version", kVersion}}},
    };
    return Reply(id, result);
}

ServiceResponse ControlPlaneService::HandleToolsList(const Principal& principal,
                                                     const ServiceRequest& request,
                                                     const nlohmann::json& id,
                                                     const nlohmann::json& /*params*/) {
    if (auto denied = Authorize(principal, "tools/list", "*", request, {}, id)) {
        return *denied;
    }
    return Reply(id, router_.ListTools());
}

ServiceResponse ControlPlaneService::HandleToolsCall(const Principal& principal,
                                                     const ServiceRequest& request,
                                                     const nlohmann::json& id,
                                                     const nlohmann::json& params) {
    auto name = params.find("name");
    if (name == params.end() || !name->is_string() || name->get<std::string>().empty()) {
        return Fail(id, MakeError(ErrorCategory::InvalidParams, "tools/call",
                                  "Missing tool name"));
    }
    nlohmann::json arguments = nlohmann::json::object();
    if (auto args = params.find("arguments"); args != params.end() && !args->is_null()) {
        if (!args->is_object()) {
            return Fail(id, MakeError(ErrorCategory::InvalidParams, "tools/call",
                                      "arguments must be an object"));
        }
        arguments = *args;
    }

    const auto tool = name->get<std::string>();
    if (auto denied = Authorize(principal, "tools/call", tool, request, arguments, id)) {
        return *denied;
    }

    auto result = router_.CallTool(SessionOf(principal, request), tool, arguments);
    if (result.IsErr()) {
        LogInfo("service", "tools/call '" + tool + "' failed: " + result.Error().ToString());
        return Fail(id, result.Error());
    }
    return Reply(id, result.Value());
}

ServiceResponse ControlPlaneService::HandleResourcesList(const Principal& principal,
                                                         const ServiceRequest& request,
                                                         const nlohmann::json& id,
                                                         const nlohmann::json& /*params*/) {
    if (auto denied = Authorize(principal, "resources/list", "*", request, {}, id)) {
        return *denied;
    }
    return Reply(id, router_.ListResources(SessionOf(principal, request)));
}

ServiceResponse ControlPlaneService::HandlePromptsList(const Principal& principal,
                                                       const ServiceRequest& request,
                                                       const nlohmann::json& id,
                                                       const nlohmann::json& /*params*/) {
    if (auto denied = Authorize(principal, "prompts/list", "*", request, {}, id)) {
        return *denied;
    }
    return Reply(id, router_.ListPrompts(SessionOf(principal, request)));
}

// ---------------------------------------------------------------------------
// Session, admin, health
// ---------------------------------------------------------------------------

ServiceResponse ControlPlaneService::CloseSession(const ServiceRequest& request) {
    auto principal = gate_.Authenticate(request.authorization);
    if (principal.IsErr()) return Fail(nullptr, principal.Error());
    if (auto bad = CheckRequestText(request, "CloseSession")) {
        return Fail(nullptr, *bad);
    }

    const auto session = SessionOf(principal.Value(), request);
    auto cancelled = router_.CancelSession(session);
    LogInfo("service", "Session '" + session + "' closed, " +
                           std::to_string(cancelled) + " call(s) cancelled");
    return Reply(nullptr, {{"session", session}, {"cancelled", cancelled}});
}

ServiceResponse ControlPlaneService::ResetServer(const ServiceRequest& request,
                                                 const std::string& server_id) {
    auto principal = gate_.Authenticate(request.authorization);
    if (principal.IsErr()) return Fail(nullptr, principal.Error());

    if (auto denied = Authorize(principal.Value(), "admin/reset", server_id, request, {},
                                nullptr)) {
        return *denied;
    }

    auto reset = lifecycle_.ResetServer(server_id);
    if (reset.IsErr()) {
        auto response = Fail(nullptr, reset.Error());
        response.status = 404;
        return response;
    }
    auto* server = lifecycle_.Find(server_id);
    return Reply(nullptr, {{"server_id", server_id},
                           {"state", ServerStateName(server->State())}});
}

ServiceResponse ControlPlaneService::Health() const {
    nlohmann::json servers = nlohmann::json::object();
    bool all_ready = true;
    for (const auto& status : lifecycle_.Snapshot()) {
        servers[status.id] = ServerStateName(status.state);
        auto* server = lifecycle_.Find(status.id);
        bool enabled = server != nullptr && server->Descriptor().enabled;
        if (enabled && status.state != ServerState::Ready) all_ready = false;
    }

    ServiceResponse response;
    response.body = {
        {"status", all_ready ? "healthy" : "degraded"},
        {"version", kVersion},
        {"timestamp", UtcTimestamp()},
        {"mcp_servers", servers},
    };
    return response;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::optional<ServiceResponse> ControlPlaneService::Authorize(
    const Principal& principal, const std::string& action,
    const std::string& resource, const ServiceRequest& request,
    const nlohmann::json& arguments, const nlohmann::json& id) const {
    PolicyContext context;
    context.session = SessionOf(principal, request);
    if (arguments.is_object()) context.arguments = arguments;

    auto decision = policy_.Evaluate(principal, action, resource, context);
    std::string rule = decision.rule_index
        ? "#" + std::to_string(*decision.rule_index + 1)
        : std::string("default");
    LogInfo("audit", "principal=" + principal.name + " action=" + action +
                         " resource=" + resource + " session=" + context.session +
                         " decision=" + (decision.Allowed() ? "allow" : "deny") +
                         " rule=" + rule);
    if (decision.Allowed()) return std::nullopt;

    return Fail(id, MakeError(ErrorCategory::Forbidden, action,
                              "Forbidden: '" + principal.name + "' may not " + action +
                                  (resource == "*" ? "" : " '" + resource + "'"),
                              resource));
}

ServiceResponse ControlPlaneService::Reply(const nlohmann::json& id,
                                           const nlohmann::json& result) {
    return ServiceResponse{200, MakeResult(id, result)};
}

ServiceResponse ControlPlaneService::Fail(const nlohmann::json& id, const Error& error) {
    return ServiceResponse{HttpStatusFor(error), MakeErrorResponse(id, error)};
}

} // namespace mcp_relay
