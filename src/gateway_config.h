#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chatgate {

struct BackendEndpoint {
    std::string scheme = "http";
    std::string host = "localhost";
    int port = 4000;
    std::string base_path;

    // scheme://host:port, without the base path.
    auto Origin() const -> std::string;
    // Origin plus base path, e.g. "http://localhost:4000/litellm".
    auto BaseUrl() const -> std::string;
};

struct GatewayConfig {
    std::string listen_host = "0.0.0.0";
    int listen_port = 8000;

    BackendEndpoint backend;
    int backend_connect_timeout_sec = 10;
    int backend_read_timeout_sec = 600;
    int backend_write_timeout_sec = 30;

    bool trace_enabled = true;
    std::string trace_project = "chatgate";

    std::string log_level = "info";
};

inline constexpr const char* kDefaultBackendUrl = "http://localhost:4000";

/**
 * @brief Splits a backend URL into scheme, host, port and base path.
 *
 * A missing scheme means http. A missing port means 80 for http and 443 for https.
 * @throws std::invalid_argument for an unsupported scheme, an empty host or a bad port.
 */
auto ParseBackendUrl(const std::string& url) -> BackendEndpoint;

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

auto LoadConfig(const EnvLookup& env) -> GatewayConfig;

auto LoadConfigFromEnv() -> GatewayConfig;

/**
 * @brief Applies --host/--port command line overrides.
 *
 * Accepts "--host H", "--host=H", "--port P" and "--port=P".
 * @throws std::invalid_argument for unknown flags, missing values or bad ports.
 */
auto ApplyArgs(GatewayConfig& cfg, const std::vector<std::string>& args) -> void;

} // namespace chatgate
