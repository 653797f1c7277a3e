#include "gateway_handler.h"

#include "errors.h"
#include "obs/context.h"
#include "obs/logging.h"
#include "request_normalizer.h"
#include "response_normalizer.h"

#include <stdexcept>
#include <utility>

namespace chatgate {

namespace {

constexpr size_t kMaxLoggedBody = 2000;

auto SanitizedHeaders(const HeaderMap& headers) -> nlohmann::json {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, value] : headers) {
        out[name] = EqualsIgnoreCase(name, "Authorization") ? "<redacted>" : value;
    }
    return out;
}

auto StatesToJson(const std::vector<RequestState>& states) -> nlohmann::json {
    nlohmann::json out = nlohmann::json::array();
    for (auto s : states) {
        out.push_back(StateToString(s));
    }
    return out;
}

} // namespace

auto DefaultResponseHeaders() -> HeaderMap {
    return {
        {"Content-Type", "application/json"},
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "*"},
        {"Access-Control-Allow-Headers", "*"},
    };
}

GatewayHandler::GatewayHandler(std::shared_ptr<IBackendClient> backend,
                               std::shared_ptr<obs::SpanObserver> observer)
    : backend_(std::move(backend)), observer_(std::move(observer)) {
    if (!backend_) {
        throw std::invalid_argument("GatewayHandler requires a backend client");
    }
}

auto GatewayHandler::Health() -> GatewayResponse {
    GatewayResponse out;
    out.status = 200;
    out.body = {{"status", "healthy"}};
    out.headers = DefaultResponseHeaders();
    return out;
}

auto GatewayHandler::TargetUrl(const std::string& path) const -> std::string {
    std::string target = backend_->Target();
    if (path.empty() || path.front() != '/') {
        target += "/";
    }
    return target + path;
}

auto GatewayHandler::Handle(const InboundRequest& req) const -> GatewayResponse {
    GatewayResponse out;
    out.headers = DefaultResponseHeaders();
    RequestLifecycle lifecycle;

    const auto* outer = obs::CurrentContext();
    obs::ScopedContext scope(outer ? *outer : obs::Context{});
    if (!req.request_id.empty()) scope.context().request_id = req.request_id;
    scope.context().method = req.method;
    scope.context().path = req.path;

    obs::LogEvent(obs::LogLevel::Info, "proxy_request_received", "gateway",
                  {{"target_url", TargetUrl(req.path)},
                   {"body_bytes", req.body.size()},
                   {"headers", SanitizedHeaders(req.headers)}});
    obs::LogEvent(obs::LogLevel::Debug, "proxy_request_body", "gateway",
                  {{"body", obs::TruncateForLog(req.body, kMaxLoggedBody)}});

    try {
        lifecycle.Advance(RequestState::NORMALIZING);
        auto chat = NormalizeChatRequest(req);

        scope.context().model = chat.model;
        obs::LogEvent(obs::LogLevel::Info, "proxy_request_normalized", "gateway",
                      {{"messages", chat.messages.size()},
                       {"temperature", chat.temperature},
                       {"max_tokens", chat.max_tokens},
                       {"has_credential", !chat.credential.empty()}});

        lifecycle.Advance(RequestState::INVOKING);
        auto result = Invoke(chat, req, scope.context());
        if (!result) {
            throw NullResponseError();
        }

        lifecycle.Advance(RequestState::NORMALIZING_RESPONSE);
        out.body = NormalizeResponse(*result);
        out.status = 200;
        if (out.body.contains("error") && std::holds_alternative<Unrecognized>(*result)) {
            obs::LogEvent(obs::LogLevel::Warn, "backend_response_degraded", "gateway",
                          {{"reason", std::get<Unrecognized>(*result).reason}});
        }
    } catch (const std::exception& e) {
        auto classified = ClassifyError(std::current_exception());
        lifecycle.Advance(RequestState::FAILED);
        obs::LogEvent(classified.status_code >= 500 ? obs::LogLevel::Error : obs::LogLevel::Warn,
                      "proxy_request_failed", "gateway",
                      {{"status_code", classified.status_code},
                       {"error_code", classified.code},
                       {"error", e.what()}});
        out.status = classified.status_code;
        out.body = {{"detail", classified.message}};
        out.error = std::move(classified);
    }

    lifecycle.Advance(RequestState::RESPONDING);
    out.states = lifecycle.History();
    obs::LogEvent(obs::LogLevel::Debug, "proxy_request_states", "gateway",
                  {{"states", StatesToJson(out.states)}});
    return out;
}

auto GatewayHandler::Invoke(const NormalizedChatRequest& chat, const InboundRequest& req,
                            obs::Context& log_ctx) const -> std::optional<BackendResult> {
    auto parent = obs::tracing::ParseTraceparent(req.Header("traceparent").value_or(""));
    auto span_ctx = obs::tracing::ChildContext(parent);
    log_ctx.trace_id = span_ctx.trace_id;

    obs::Span span(kBackendSpanName, span_ctx, parent.valid() ? parent.span_id : "", observer_.get());
    span.SetAttribute("target", backend_->Target());
    span.SetAttribute("model", chat.model);
    span.SetAttribute("messages", chat.messages.size());
    span.SetAttribute("temperature", chat.temperature);
    span.SetAttribute("max_tokens", chat.max_tokens);

    CallContext call;
    call.request_id = req.request_id;
    call.traceparent = span_ctx.ToTraceparent();
    try {
        auto result = backend_->ChatCompletion(chat, call);
        if (result) {
            span.SetAttribute("result_kind", ResultKindName(*result));
        } else {
            span.SetAttribute("result_kind", "null");
            span.SetError("backend returned null response");
        }
        return result;
    } catch (const std::exception& e) {
        span.SetError(e.what());
        throw;
    }
}

} // namespace chatgate
