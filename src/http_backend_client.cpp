#include "http_backend_client.h"

#include "errors.h"
#include "obs/logging.h"

#include <utility>

namespace chatgate {

namespace {

constexpr size_t kMaxErrorExcerpt = 512;

std::string JoinPath(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
    if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
    return base + path;
}

} // namespace

HttpBackendClient::HttpBackendClient(BackendEndpoint endpoint, Timeouts timeouts)
    : endpoint_(std::move(endpoint)), timeouts_(timeouts) {}

auto HttpBackendClient::Target() const -> std::string {
    return endpoint_.BaseUrl();
}

auto HttpBackendClient::MakeClient() const -> std::unique_ptr<httplib::Client> {
    auto cli = std::make_unique<httplib::Client>(endpoint_.Origin());
    cli->set_connection_timeout(timeouts_.connect_sec, 0);
    cli->set_read_timeout(timeouts_.read_sec, 0);
    cli->set_write_timeout(timeouts_.write_sec, 0);
    cli->set_keep_alive(false);
    return cli;
}

auto HttpBackendClient::BuildRequestBody(const NormalizedChatRequest& req) -> nlohmann::json {
    nlohmann::json j;
    j["model"] = req.model;
    j["messages"] = nlohmann::json::array();
    for (const auto& m : req.messages) {
        j["messages"].push_back({{"role", m.role}, {"content", m.content}});
    }
    j["temperature"] = req.temperature;
    j["max_tokens"] = req.max_tokens;
    j["stream"] = false;
    return j;
}

auto HttpBackendClient::DescribeHttpFailure(int status, const std::string& body) -> std::string {
    std::string detail;
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        auto err = j.find("error");
        if (err != j.end() && err->is_object() && err->contains("message") && (*err)["message"].is_string()) {
            detail = (*err)["message"].get<std::string>();
        } else if (err != j.end() && err->is_string()) {
            detail = err->get<std::string>();
        } else if (j.contains("detail") && j["detail"].is_string()) {
            detail = j["detail"].get<std::string>();
        }
    }
    if (detail.empty()) {
        detail = obs::TruncateForLog(body, kMaxErrorExcerpt);
    }
    std::string out = "backend returned HTTP " + std::to_string(status);
    if (!detail.empty()) {
        out += ": " + detail;
    }
    return out;
}

auto HttpBackendClient::ChatCompletion(const NormalizedChatRequest& req, const CallContext& ctx)
    -> std::optional<BackendResult> {
    auto cli = MakeClient();
    if (!cli->is_valid()) {
        throw InvocationError("unsupported backend URL: " + Target());
    }

    httplib::Headers headers;
    if (!req.credential.empty()) {
        headers.emplace("Authorization", "Bearer " + req.credential);
    }
    if (!ctx.request_id.empty()) {
        headers.emplace("X-Request-ID", ctx.request_id);
    }
    if (!ctx.traceparent.empty()) {
        headers.emplace("traceparent", ctx.traceparent);
    }

    const auto path = JoinPath(endpoint_.base_path, kChatCompletionsPath);
    const auto payload = BuildRequestBody(req).dump();
    obs::LogEvent(obs::LogLevel::Debug, "backend_request", "backend",
                  {{"target", endpoint_.Origin() + path},
                   {"model", req.model},
                   {"messages", req.messages.size()},
                   {"body_bytes", payload.size()}});

    auto res = cli->Post(path, headers, payload, "application/json");
    if (!res) {
        throw TransportError(httplib::to_string(res.error()) + " (" + endpoint_.Origin() + path + ")");
    }
    if (res->status < 200 || res->status >= 300) {
        throw InvocationError(DescribeHttpFailure(res->status, res->body));
    }
    return ResolveBackendPayload(res->body);
}

} // namespace chatgate
