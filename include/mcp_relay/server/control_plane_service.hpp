#pragma once

#include <mcp_relay/auth/auth_gate.hpp>
#include <mcp_relay/auth/policy_engine.hpp>
#include <mcp_relay/process/lifecycle_manager.hpp>
#include <mcp_relay/protocol/json_rpc.hpp>
#include <mcp_relay/routing/request_router.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// What the HTTP layer extracts from a request before handing it over.
struct ServiceRequest {
    std::string authorization;       // Authorization header value
    std::string session;             // X-MCP-Session header value
    std::string body;                // raw POST body
    std::optional<std::string> request_id;  // GET ?request_id=
};

struct ServiceResponse {
    int status = 200;
    nlohmann::json body;
};

// ---------------------------------------------------------------------------
// ControlPlaneService — the control plane's request handling without HTTP:
// authenticate, parse, authorize (audited), route, shape the JSON-RPC reply.
// ---------------------------------------------------------------------------
class ControlPlaneService {
public:
    ControlPlaneService(const AuthGate& gate,
                        const PolicyEngine& policy,
                        RequestRouter& router,
                        LifecycleManager& lifecycle);

    /// One MCP method endpoint. Initialize, ToolsCall take a JSON-RPC body;
    /// the list methods answer with `request_id` as the id.
    [[nodiscard]] ServiceResponse Handle(Method method, const ServiceRequest& request);

    /// Cancel the caller's outstanding calls.
    [[nodiscard]] ServiceResponse CloseSession(const ServiceRequest& request);

    /// Operator reset of one server; needs policy action admin/reset.
    [[nodiscard]] ServiceResponse ResetServer(const ServiceRequest& request,
                                              const std::string& server_id);

    /// Unauthenticated health summary.
    [[nodiscard]] ServiceResponse Health() const;

private:
    using Handler = ServiceResponse (ControlPlaneService::*)(
        const Principal&, const ServiceRequest&, const nlohmann::json& id,
        const nlohmann::json& params);

    ServiceResponse HandleInitialize(const Principal& principal, const ServiceRequest& request,
                                     const nlohmann::json& id, const nlohmann::json& params);
    ServiceResponse HandleToolsList(const Principal& principal, const ServiceRequest& request,
                                    const nlohmann::json& id, const nlohmann::json& params);
    ServiceResponse HandleToolsCall(const Principal& principal, const ServiceRequest& request,
                                    const nlohmann::json& id, const nlohmann::json& params);
    ServiceResponse HandleResourcesList(const Principal& principal,
                                        const ServiceRequest& request,
                                        const nlohmann::json& id,
                                        const nlohmann::json& params);
    ServiceResponse HandlePromptsList(const Principal& principal, const ServiceRequest& request,
                                      const nlohmann::json& id, const nlohmann::json& params);

    [[nodiscard]] static Handler HandlerFor(Method method);

    /// Evaluate and audit. Nullopt when allowed, the 403 reply otherwise.
    [[nodiscard]] std::optional<ServiceResponse> Authorize(
        const Principal& principal, const std::string& action,
        const std::string& resource, const ServiceRequest& request,
        const nlohmann::json& arguments, const nlohmann::json& id) const;

    [[nodiscard]] static ServiceResponse Reply(const nlohmann::json& id,
                                               const nlohmann::json& result);
    [[nodiscard]] static ServiceResponse Fail(const nlohmann::json& id, const Error& error);

    const AuthGate& gate_;
    const PolicyEngine& policy_;
    RequestRouter& router_;
    LifecycleManager& lifecycle_;
};

/// HTTP status for an error sent back in a JSON-RPC envelope.
[[nodiscard]] int HttpStatusFor(const Error& error);

} // namespace mcp_relay
