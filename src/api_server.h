#pragma once

#include <memory>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "gateway_handler.h"
#include "types.h"

namespace chatgate::api {

class ApiServer {
public:
    explicit ApiServer(std::shared_ptr<GatewayHandler> handler);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    // Blocks until Stop() is called. Returns false if the socket could not be bound.
    auto Start(const std::string& host, int port) -> bool;
    void Stop();

    static auto ToInboundRequest(const httplib::Request& req, const std::string& request_id) -> InboundRequest;

private:
    void Initialize();

    void HandleHealth(const httplib::Request& req, httplib::Response& res);
    void HandleProxy(const httplib::Request& req, httplib::Response& res);
    void HandleCorsPreflight(const httplib::Request& req, httplib::Response& res);

    static void SendGatewayResponse(httplib::Response& res, const GatewayResponse& response);
    static void SendJson(httplib::Response& res, const nlohmann::json& j, int status = 200);

    httplib::Server svr_;
    std::shared_ptr<GatewayHandler> handler_;
};

auto GetRequestId(const httplib::Request& req) -> std::string;

} // namespace chatgate::api
