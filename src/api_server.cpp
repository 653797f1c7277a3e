#include "api_server.h"

#include "error_classifier.h"
#include "obs/context.h"
#include "obs/error_codes.h"
#include "obs/http_log.h"
#include "obs/logging.h"
#include "route_registry.h"

#include <spdlog/spdlog.h>
#include <uuid/uuid.h>

#include <stdexcept>
#include <utility>

namespace chatgate::api {

namespace {

constexpr const char* kComponent = "api_server";
constexpr const char* kPreflightMethods = "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";
constexpr const char* kPreflightMaxAge = "600";
constexpr const char* kProxiedMethods = "DELETE, GET, PATCH, POST, PUT";
constexpr const char* kMethodNotAllowed = "Method Not Allowed";

std::string GenerateUuid() {
    uuid_t out;
    uuid_generate(out);
    char str[37];
    uuid_unparse(out, str);
    return std::string(str);
}

} // namespace

auto GetRequestId(const httplib::Request& req) -> std::string {
    if (req.has_header("X-Request-ID")) {
        auto rid = req.get_header_value("X-Request-ID");
        if (!rid.empty()) {
            return rid;
        }
    }
    return GenerateUuid();
}

ApiServer::ApiServer(std::shared_ptr<GatewayHandler> handler)
    : handler_(std::move(handler)) {
    if (!handler_) {
        throw std::invalid_argument("ApiServer requires a gateway handler");
    }
    Initialize();
}

ApiServer::~ApiServer() {
    Stop();
}

void ApiServer::Initialize() {
    svr_.set_payload_max_length(1024 * 1024 * 50); // 50MB
    svr_.set_read_timeout(30, 0);
    svr_.set_write_timeout(30, 0);

    // Anything that escapes a handler still gets the classified 500 shape.
    svr_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        auto classified = ClassifyError(ep);
        obs::LogEvent(obs::LogLevel::Error, "http_handler_exception", kComponent,
                      {{"route", req.path}, {"method", req.method}, {"error_code", classified.code},
                       {"error", classified.message}});
        for (const auto& [name, value] : DefaultResponseHeaders()) {
            if (name != "Content-Type") res.set_header(name, value);
        }
        SendJson(res, {{"detail", classified.message}}, classified.status_code);
    });

    for (const auto& route : kGatewayRoutes) {
        httplib::Server::Handler fn;
        if (route.handler_name == kHandlerHealth) {
            fn = [this](const httplib::Request& req, httplib::Response& res) { HandleHealth(req, res); };
        } else if (route.handler_name == kHandlerPreflight) {
            fn = [this](const httplib::Request& req, httplib::Response& res) { HandleCorsPreflight(req, res); };
        } else if (route.handler_name == kHandlerProxy) {
            fn = [this](const httplib::Request& req, httplib::Response& res) { HandleProxy(req, res); };
        } else {
            throw std::logic_error("Unknown route handler: " + route.handler_name);
        }

        if (route.method == "GET") {
            svr_.Get(route.pattern, fn);
        } else if (route.method == "POST") {
            svr_.Post(route.pattern, fn);
        } else if (route.method == "PUT") {
            svr_.Put(route.pattern, fn);
        } else if (route.method == "DELETE") {
            svr_.Delete(route.pattern, fn);
        } else if (route.method == "PATCH") {
            svr_.Patch(route.pattern, fn);
        } else if (route.method == "OPTIONS") {
            svr_.Options(route.pattern, fn);
        } else {
            throw std::logic_error("Unsupported route method: " + route.method);
        }
    }
    spdlog::info("Registered {} gateway routes", kGatewayRoutes.size());
}

auto ApiServer::Start(const std::string& host, int port) -> bool {
    spdlog::info("HTTP gateway listening on {}:{}", host, port);
    bool ok = svr_.listen(host.c_str(), port);
    if (!ok) {
        spdlog::error("HTTP gateway failed to listen on {}:{}", host, port);
    }
    return ok;
}

void ApiServer::Stop() {
    svr_.stop();
}

auto ApiServer::ToInboundRequest(const httplib::Request& req, const std::string& request_id) -> InboundRequest {
    InboundRequest in;
    in.method = req.method;
    in.path = req.path;
    for (const auto& [name, value] : req.headers) {
        in.headers.emplace(name, value);
    }
    in.body = req.body;
    in.request_id = request_id;
    return in;
}

void ApiServer::HandleHealth(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, kComponent, rid);
    res.set_header("X-Request-ID", rid);
    SendGatewayResponse(res, GatewayHandler::Health());
}

void ApiServer::HandleProxy(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, kComponent, rid);
    obs::Context ctx;
    ctx.request_id = rid;
    ctx.method = req.method;
    ctx.path = req.path;
    obs::ScopedContext scope(std::move(ctx));

    auto response = handler_->Handle(ToInboundRequest(req, rid));
    if (response.error) {
        log.SetError(response.error->code, response.error->message);
    }
    res.set_header("X-Request-ID", rid);
    SendGatewayResponse(res, response);
}

void ApiServer::HandleCorsPreflight(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, kComponent, rid);
    res.set_header("X-Request-ID", rid);

    // Only OPTIONS with both Origin and Access-Control-Request-Method is a preflight.
    // Any other OPTIONS is a plain request for a method the gateway does not proxy.
    auto origin = req.get_header_value("Origin");
    if (origin.empty() || !req.has_header("Access-Control-Request-Method")) {
        for (const auto& [name, value] : DefaultResponseHeaders()) {
            if (name != "Content-Type") res.set_header(name, value);
        }
        res.set_header("Allow", kProxiedMethods);
        log.SetError(obs::kErrHttpMethodNotAllowed, kMethodNotAllowed);
        SendJson(res, {{"detail", kMethodNotAllowed}}, 405);
        return;
    }

    auto requested_headers = req.get_header_value("Access-Control-Request-Headers");
    res.set_header("Access-Control-Allow-Origin", origin);
    res.set_header("Access-Control-Allow-Methods", kPreflightMethods);
    res.set_header("Access-Control-Allow-Headers", requested_headers.empty() ? "*" : requested_headers);
    res.set_header("Access-Control-Allow-Credentials", "true");
    res.set_header("Access-Control-Max-Age", kPreflightMaxAge);
    res.set_header("Vary", "Origin");
    res.status = 200;
    res.set_content("OK", "text/plain");
}

void ApiServer::SendGatewayResponse(httplib::Response& res, const GatewayResponse& response) {
    for (const auto& [name, value] : response.headers) {
        // set_content owns Content-Type.
        if (name == "Content-Type") continue;
        res.set_header(name, value);
    }
    SendJson(res, response.body, response.status);
}

void ApiServer::SendJson(httplib::Response& res, const nlohmann::json& j, int status) {
    res.status = status;
    res.set_content(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

} // namespace chatgate::api
