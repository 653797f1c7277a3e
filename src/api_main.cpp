#include "api_server.h"
#include "gateway_config.h"
#include "gateway_handler.h"
#include "http_backend_client.h"
#include "obs/span_observer.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

chatgate::api::ApiServer* g_server = nullptr;

void HandleSignal(int) {
    if (g_server) {
        g_server->Stop();
    }
}

void PrintUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--host HOST] [--port PORT]\n"
              << "environment: GATEWAY_HOST, GATEWAY_PORT, BACKEND_BASE_URL, BACKEND_CONNECT_TIMEOUT_SEC,\n"
              << "             BACKEND_READ_TIMEOUT_SEC, BACKEND_WRITE_TIMEOUT_SEC, TRACE_ENABLED,\n"
              << "             TRACE_PROJECT_NAME, LOG_LEVEL\n";
}

} // namespace

int main(int argc, char** argv) {
    auto console = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(console);

    chatgate::GatewayConfig cfg;
    try {
        cfg = chatgate::LoadConfigFromEnv();
        chatgate::ApplyArgs(cfg, std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        PrintUsage(argv[0]);
        return 2;
    }
    auto level = spdlog::level::from_str(cfg.log_level);
    if (level == spdlog::level::off && cfg.log_level != "off") {
        spdlog::warn("Unknown LOG_LEVEL '{}', using info", cfg.log_level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);

    spdlog::info("Backend base URL: {}", cfg.backend.BaseUrl());
    spdlog::info("Tracing {} (project {})", cfg.trace_enabled ? "enabled" : "disabled", cfg.trace_project);

    chatgate::HttpBackendClient::Timeouts timeouts;
    timeouts.connect_sec = cfg.backend_connect_timeout_sec;
    timeouts.read_sec = cfg.backend_read_timeout_sec;
    timeouts.write_sec = cfg.backend_write_timeout_sec;
    auto backend = std::make_shared<chatgate::HttpBackendClient>(cfg.backend, timeouts);

    std::shared_ptr<chatgate::obs::SpanObserver> observer;
    if (cfg.trace_enabled) {
        observer = std::make_shared<chatgate::obs::LoggingSpanObserver>(cfg.trace_project);
    }

    auto handler = std::make_shared<chatgate::GatewayHandler>(backend, observer);
    chatgate::api::ApiServer server(handler);

    g_server = &server;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    bool ok = false;
    try {
        ok = server.Start(cfg.listen_host, cfg.listen_port);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error in gateway: {}", e.what());
        ok = false;
    }
    g_server = nullptr;
    return ok ? 0 : 1;
}
