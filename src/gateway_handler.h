#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "error_classifier.h"
#include "ibackend_client.h"
#include "obs/context.h"
#include "obs/span.h"
#include "request_state_machine.h"
#include "types.h"

namespace chatgate {

struct GatewayResponse {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
    HeaderMap headers;
    // States visited, RECEIVED through RESPONDING. Empty for /health.
    std::vector<RequestState> states;
    std::optional<ClassifiedError> error;
};

/**
 * @brief Normalizes, forwards and answers one chat-completion request.
 *
 * Holds no per-request state; a single instance serves all worker threads.
 */
class GatewayHandler {
public:
    explicit GatewayHandler(std::shared_ptr<IBackendClient> backend,
                            std::shared_ptr<obs::SpanObserver> observer = nullptr);

    // Never throws for failures of the request itself; they become classified responses.
    auto Handle(const InboundRequest& req) const -> GatewayResponse;

    static auto Health() -> GatewayResponse;

    static constexpr const char* kBackendSpanName = "backend.chat_completion";

private:
    // Calls the backend inside the backend span; stamps the span's trace id onto log_ctx.
    auto Invoke(const NormalizedChatRequest& chat, const InboundRequest& req, obs::Context& log_ctx) const
        -> std::optional<BackendResult>;
    auto TargetUrl(const std::string& path) const -> std::string;

    std::shared_ptr<IBackendClient> backend_;
    std::shared_ptr<obs::SpanObserver> observer_;
};

// Content type plus wildcard CORS headers carried by every gateway response.
auto DefaultResponseHeaders() -> HeaderMap;

} // namespace chatgate
