#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/protocol/json_rpc.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// IControlPlaneClient — the bridge's view of the control plane. Abstract so
// tests can drive the bridge without a network.
// ---------------------------------------------------------------------------
class IControlPlaneClient {
public:
    virtual ~IControlPlaneClient() = default;

    /// Forward one request (its id already replaced by a correlation id).
    /// Ok: the control plane's JSON-RPC reply, result or error.
    /// Err: no usable reply. TransportFailure when the control plane is
    /// unreachable, otherwise the category of the HTTP status.
    [[nodiscard]] virtual Result<nlohmann::json, Error> Forward(
        Method method, const nlohmann::json& request) = 0;

    /// GET /health. Ok when the control plane answers at all.
    [[nodiscard]] virtual Result<void, Error> CheckHealth() = 0;

    /// Tell the control plane this bridge's session is over.
    [[nodiscard]] virtual Result<void, Error> CloseSession() = 0;
};

struct ControlPlaneClientOptions {
    std::string base_url = "http://localhost:8444";
    std::string token;
    std::string session_id;
    std::chrono::seconds timeout{30};
};

// ---------------------------------------------------------------------------
// HttpControlPlaneClient — IControlPlaneClient over cpp-httplib.
//
// Uses pimpl so httplib stays out of this header. Each call opens its own
// connection so worker threads never share a socket.
// ---------------------------------------------------------------------------
class HttpControlPlaneClient : public IControlPlaneClient {
public:
    explicit HttpControlPlaneClient(ControlPlaneClientOptions options);
    ~HttpControlPlaneClient() override;

    HttpControlPlaneClient(const HttpControlPlaneClient&) = delete;
    HttpControlPlaneClient& operator=(const HttpControlPlaneClient&) = delete;

    Result<nlohmann::json, Error> Forward(Method method,
                                          const nlohmann::json& request) override;
    Result<void, Error> CheckHealth() override;
    Result<void, Error> CloseSession() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Endpoint path for a forwarded method, nullopt when the method is not
/// forwarded. GET endpoints carry the correlation id as ?request_id=.
[[nodiscard]] std::optional<std::string> EndpointFor(Method method,
                                                     const nlohmann::json& id);

/// True when `body` is a JSON-RPC response envelope.
[[nodiscard]] bool IsRpcResponse(const nlohmann::json& body);

} // namespace mcp_relay
