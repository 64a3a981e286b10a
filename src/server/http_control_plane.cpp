#include <mcp_relay/server/http_control_plane.hpp>

#include <mcp_relay/core/log.hpp>

#include <httplib.h>

namespace mcp_relay {

namespace {

constexpr const char* kJsonType = "application/json";
constexpr const char* kSessionHeader = "X-MCP-Session";

ServiceRequest ToServiceRequest(const httplib::Request& req) {
    ServiceRequest request;
    request.authorization = req.get_header_value("Authorization");
    request.session = req.get_header_value(kSessionHeader);
    request.body = req.body;
    if (req.has_param("request_id")) {
        request.request_id = req.get_param_value("request_id");
    }
    return request;
}

void WriteResponse(const ServiceResponse& response, httplib::Response& res) {
    res.status = response.status;
    if (response.status == 401) {
        res.set_header("WWW-Authenticate", "Bearer");
    }
    res.set_content(DumpForWire(response.body), kJsonType);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttpControlPlane::Impl {
    ControlPlaneService& service;
    HttpServerOptions options;
    httplib::Server server;

    Impl(ControlPlaneService& svc, HttpServerOptions opts)
        : service(svc), options(std::move(opts)) {
        const auto threads = static_cast<size_t>(options.threads > 0 ? options.threads : 1);
        server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
        RegisterRoutes();
    }

    void Route(const char* pattern, Method method, bool post) {
        auto handler = [this, method](const httplib::Request& req, httplib::Response& res) {
            WriteResponse(service.Handle(method, ToServiceRequest(req)), res);
        };
        if (post) {
            server.Post(pattern, handler);
        } else {
            server.Get(pattern, handler);
        }
    }

    void RegisterRoutes() {
        Route("/mcp/initialize", Method::Initialize, true);
        Route("/mcp/tools", Method::ToolsList, false);
        Route("/mcp/tools/call", Method::ToolsCall, true);
        Route("/mcp/resources", Method::ResourcesList, false);
        Route("/mcp/prompts", Method::PromptsList, false);

        server.Post("/mcp/session/close",
                    [this](const httplib::Request& req, httplib::Response& res) {
                        WriteResponse(service.CloseSession(ToServiceRequest(req)), res);
                    });

        server.Post(R"(/admin/servers/([^/]+)/reset)",
                    [this](const httplib::Request& req, httplib::Response& res) {
                        WriteResponse(service.ResetServer(ToServiceRequest(req),
                                                          req.matches[1].str()),
                                      res);
                    });

        server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            WriteResponse(service.Health(), res);
        });

        server.set_exception_handler(
            [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
                std::string what = "unknown exception";
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    what = e.what();
                } catch (...) {
                    // Non-standard exception; reported as unknown below.
                }
                LogError("http", req.method + " " + req.path + " failed: " + what);
                res.status = 500;
                res.set_content(MakeErrorResponse(nullptr, rpc_code::kInternal,
                                                  "Internal error")
                                    .dump(),
                                kJsonType);
            });

        server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            LogDebug("http", req.method + " " + req.path + " -> " +
                                 std::to_string(res.status));
        });
    }
};

// ---------------------------------------------------------------------------
// HttpControlPlane
// ---------------------------------------------------------------------------

HttpControlPlane::HttpControlPlane(ControlPlaneService& service, HttpServerOptions options)
    : impl_(std::make_unique<Impl>(service, std::move(options))) {}

HttpControlPlane::~HttpControlPlane() {
    Stop();
}

Result<int, Error> HttpControlPlane::Bind() {
    const auto& host = impl_->options.host;
    int port = impl_->options.port;
    if (port == 0) {
        port = impl_->server.bind_to_any_port(host);
    } else if (!impl_->server.bind_to_port(host, port)) {
        port = -1;
    }
    if (port < 0) {
        return Result<int, Error>::Err(MakeError(
            ErrorCategory::TransportFailure, "Bind",
            "Cannot listen on " + host + ":" + std::to_string(impl_->options.port)));
    }
    LogInfo("http", "Listening on " + host + ":" + std::to_string(port));
    return Result<int, Error>::Ok(port);
}

Result<void, Error> HttpControlPlane::Serve() {
    if (!impl_->server.listen_after_bind()) {
        return Result<void, Error>::Err(MakeError(ErrorCategory::TransportFailure,
                                                  "Serve", "HTTP server stopped abnormally"));
    }
    return Result<void, Error>::Ok();
}

void HttpControlPlane::Stop() {
    if (impl_->server.is_running()) {
        impl_->server.stop();
    }
}

bool HttpControlPlane::IsRunning() const {
    return impl_->server.is_running();
}

} // namespace mcp_relay
