#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "obs/logging.h"

namespace chatgate {
namespace obs {

/**
 * @brief Emits one "http_access" line per inbound request when the handler returns.
 *
 * The level follows the final status: 5xx logs as ERROR, 4xx as WARN, anything else as INFO.
 * Handlers that already know why a request failed attach it with SetError().
 */
class HttpRequestLogScope {
public:
    HttpRequestLogScope(const httplib::Request& req,
                        const httplib::Response& res,
                        std::string component,
                        const std::string& request_id)
        : res_(res),
          component_(std::move(component)),
          start_(std::chrono::steady_clock::now()) {
        fields_["method"] = req.method;
        fields_["route"] = req.path;
        fields_["request_id"] = request_id;
        fields_["request_bytes"] = req.body.size();
        if (req.has_header("User-Agent")) {
            fields_["user_agent"] = req.get_header_value("User-Agent");
        }
        if (!req.remote_addr.empty()) {
            fields_["remote_addr"] = req.remote_addr;
        }
    }

    HttpRequestLogScope(const HttpRequestLogScope&) = delete;
    HttpRequestLogScope& operator=(const HttpRequestLogScope&) = delete;

    void SetError(const std::string& error_code, const std::string& message) {
        error_code_ = error_code;
        error_ = message;
    }

    ~HttpRequestLogScope() {
        nlohmann::json payload = fields_;
        payload["status_code"] = res_.status;
        payload["response_bytes"] = res_.body.size();
        payload["duration_ms"] = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
        if (error_code_) {
            payload["error_code"] = *error_code_;
            payload["error"] = error_;
        }
        LogLevel level = LogLevel::Info;
        if (res_.status >= 500) {
            level = LogLevel::Error;
        } else if (res_.status >= 400) {
            level = LogLevel::Warn;
        }
        LogEvent(level, "http_access", component_, payload);
    }

private:
    const httplib::Response& res_;
    std::string component_;
    nlohmann::json fields_ = nlohmann::json::object();
    std::chrono::steady_clock::time_point start_;
    std::optional<std::string> error_code_;
    std::string error_;
};

} // namespace obs
} // namespace chatgate
