#pragma once

#include <string>
#include <vector>

namespace chatgate::api {

struct RouteSpec {
    std::string method;
    std::string pattern;
    std::string handler_name;
};

inline constexpr const char* kHandlerHealth = "HealthCheck";
inline constexpr const char* kHandlerProxy = "ProxyChatCompletion";
inline constexpr const char* kHandlerPreflight = "CorsPreflight";

// Registration order matters: the first matching pattern wins.
extern const std::vector<RouteSpec> kGatewayRoutes;

} // namespace chatgate::api
