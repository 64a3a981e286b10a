#include <mcp_relay/bridge/control_plane_client.hpp>

#include <mcp_relay/core/log.hpp>

#include <httplib.h>

#include <tuple>

namespace mcp_relay {

namespace {

constexpr const char* kJsonType = "application/json";

// "http://host:8444/prefix" -> {"http://host:8444", "/prefix"}
std::pair<std::string, std::string> SplitBaseUrl(const std::string& url) {
    auto scheme_end = url.find("://");
    auto path_start = url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start == std::string::npos) return {url, ""};
    auto prefix = url.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return {url.substr(0, path_start), prefix};
}

ErrorCategory CategoryFromTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::TransportFailure;
    }
}

} // anonymous namespace

std::optional<std::string> EndpointFor(Method method, const nlohmann::json& id) {
    // Correlation ids are integers, so no query escaping is needed.
    auto query = [&id] {
        return "?request_id=" + (id.is_string() ? id.get<std::string>() : id.dump());
    };
    switch (method) {
        case Method::Initialize:    return std::string("/mcp/initialize");
        case Method::ToolsList:     return "/mcp/tools" + query();
        case Method::ToolsCall:     return std::string("/mcp/tools/call");
        case Method::ResourcesList: return "/mcp/resources" + query();
        case Method::PromptsList:   return "/mcp/prompts" + query();
        case Method::Initialized:
        case Method::Ping:
            return std::nullopt;
    }
    return std::nullopt;
}

bool IsRpcResponse(const nlohmann::json& body) {
    return body.is_object() && body.value("jsonrpc", "") == "2.0" && body.contains("id") &&
           (body.contains("result") || body.contains("error"));
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttpControlPlaneClient::Impl {
    ControlPlaneClientOptions options;
    std::string origin;
    std::string prefix;

    explicit Impl(ControlPlaneClientOptions opts) : options(std::move(opts)) {
        std::tie(origin, prefix) = SplitBaseUrl(options.base_url);
    }

    std::unique_ptr<httplib::Client> MakeClient() const {
        auto client = std::make_unique<httplib::Client>(origin);
        client->set_connection_timeout(options.timeout);
        client->set_read_timeout(options.timeout);
        client->set_write_timeout(options.timeout);
        return client;
    }

    httplib::Headers Headers() const {
        return {
            {"Authorization", "Bearer " + options.token},
            {"X-MCP-Session", options.session_id},
            {"Accept", kJsonType},
        };
    }

    Result<httplib::Response, Error> Send(bool post, const std::string& path,
                                          const std::string& body) const {
        auto client = MakeClient();
        auto url = prefix + path;
        auto res = post ? client->Post(url, Headers(), body, kJsonType)
                        : client->Get(url, Headers());
        if (!res) {
            const auto error = res.error();
            return Result<httplib::Response, Error>::Err(MakeError(
                CategoryFromTransportError(error), post ? "Post" : "Get",
                "HTTP request failed: " + httplib::to_string(error), path));
        }
        return Result<httplib::Response, Error>::Ok(*res);
    }
};

// ---------------------------------------------------------------------------
// HttpControlPlaneClient
// ---------------------------------------------------------------------------

HttpControlPlaneClient::HttpControlPlaneClient(ControlPlaneClientOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

HttpControlPlaneClient::~HttpControlPlaneClient() = default;

Result<nlohmann::json, Error> HttpControlPlaneClient::Forward(
    Method method, const nlohmann::json& request) {
    using R = Result<nlohmann::json, Error>;
    auto id = request.contains("id") ? request["id"] : nlohmann::json(nullptr);
    auto path = EndpointFor(method, id);
    if (!path.has_value()) {
        return R::Err(MakeError(ErrorCategory::MethodNotFound, "Forward",
                                std::string("Method not forwarded: ") + MethodName(method)));
    }

    const bool post = method == Method::Initialize || method == Method::ToolsCall;
    LogDebug("client", std::string(post ? "POST " : "GET ") + *path);
    auto sent = impl_->Send(post, *path, post ? request.dump() : std::string());
    if (sent.IsErr()) return R::Err(std::move(sent).Error());

    const auto& res = sent.Value();
    auto body = nlohmann::json::parse(res.body, nullptr, false);
    if (!body.is_discarded() && IsRpcResponse(body)) {
        return R::Ok(std::move(body));
    }
    return R::Err(Error::FromHttpStatus("Forward", *path, res.status, res.body));
}

Result<void, Error> HttpControlPlaneClient::CheckHealth() {
    auto sent = impl_->Send(false, "/health", "");
    if (sent.IsErr()) return Result<void, Error>::Err(std::move(sent).Error());
    if (sent.Value().status != 200) {
        return Result<void, Error>::Err(
            Error::FromHttpStatus("CheckHealth", "/health", sent.Value().status,
                                  sent.Value().body));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> HttpControlPlaneClient::CloseSession() {
    auto sent = impl_->Send(true, "/mcp/session/close", "{}");
    if (sent.IsErr()) return Result<void, Error>::Err(std::move(sent).Error());
    if (sent.Value().status != 200) {
        return Result<void, Error>::Err(
            Error::FromHttpStatus("CloseSession", "/mcp/session/close",
                                  sent.Value().status, sent.Value().body));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_relay
