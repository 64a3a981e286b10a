#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/server/control_plane_service.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace mcp_relay {

struct HttpServerOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8444;  // 0: pick a free port
    int threads = 8;
};

// ---------------------------------------------------------------------------
// HttpControlPlane — the control plane's HTTP surface on cpp-httplib.
//
// Uses pimpl so httplib stays out of this header. Every route is a thin
// adapter onto ControlPlaneService.
// ---------------------------------------------------------------------------
class HttpControlPlane {
public:
    HttpControlPlane(ControlPlaneService& service, HttpServerOptions options);
    ~HttpControlPlane();

    HttpControlPlane(const HttpControlPlane&) = delete;
    HttpControlPlane& operator=(const HttpControlPlane&) = delete;

    /// Bind the listening socket. Returns the bound port.
    [[nodiscard]] Result<int, Error> Bind();

    /// Serve until Stop(). Bind() must have succeeded.
    [[nodiscard]] Result<void, Error> Serve();

    void Stop();

    [[nodiscard]] bool IsRunning() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_relay
