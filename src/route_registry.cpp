#include "route_registry.h"

namespace chatgate::api {

const std::vector<RouteSpec> kGatewayRoutes = {
    {"GET", "/health", kHandlerHealth},
    {"OPTIONS", "/.*", kHandlerPreflight},
    {"GET", "/.*", kHandlerProxy},
    {"POST", "/.*", kHandlerProxy},
    {"PUT", "/.*", kHandlerProxy},
    {"DELETE", "/.*", kHandlerProxy},
    {"PATCH", "/.*", kHandlerProxy}
};

} // namespace chatgate::api
