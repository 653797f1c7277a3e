#include "gateway_config.h"

#include "obs/logging.h"

#include <cstdlib>
#include <stdexcept>

namespace chatgate {

namespace {

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string ToLower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

int ParsePort(const std::string& s) {
    size_t pos = 0;
    int port = 0;
    try {
        port = std::stoi(s, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("invalid port: " + s);
    }
    if (pos != s.size() || port <= 0 || port > 65535) {
        throw std::invalid_argument("invalid port: " + s);
    }
    return port;
}

bool TryParseBool(const std::string& s, bool* out) {
    const std::string v = ToLower(s);
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        *out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        *out = false;
        return true;
    }
    return false;
}

void WarnIgnored(const char* name, const std::string& value, const std::string& reason) {
    obs::LogEvent(obs::LogLevel::Warn, "config_value_ignored", "config",
                  {{"variable", name}, {"value", value}, {"reason", reason}});
}

void ReadPositiveInt(const EnvLookup& env, const char* name, int* out) {
    auto v = env(name);
    if (!v || v->empty()) return;
    try {
        size_t pos = 0;
        int n = std::stoi(*v, &pos);
        if (pos != v->size() || n <= 0) {
            WarnIgnored(name, *v, "expected a positive integer");
            return;
        }
        *out = n;
    } catch (const std::exception& e) {
        WarnIgnored(name, *v, e.what());
    }
}

} // namespace

auto BackendEndpoint::Origin() const -> std::string {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return scheme + "://" + h + ":" + std::to_string(port);
}

auto BackendEndpoint::BaseUrl() const -> std::string {
    return Origin() + base_path;
}

auto ParseBackendUrl(const std::string& url) -> BackendEndpoint {
    BackendEndpoint ep;
    std::string s = url;
    auto scheme_end = s.find("://");
    if (scheme_end != std::string::npos) {
        ep.scheme = ToLower(s.substr(0, scheme_end));
        s = s.substr(scheme_end + 3);
    } else {
        ep.scheme = "http";
    }
    if (ep.scheme != "http" && ep.scheme != "https") {
        throw std::invalid_argument("unsupported backend URL scheme: " + ep.scheme);
    }

    auto slash_pos = s.find('/');
    if (slash_pos != std::string::npos) {
        ep.base_path = s.substr(slash_pos);
        s = s.substr(0, slash_pos);
    }
    while (!ep.base_path.empty() && ep.base_path.back() == '/') {
        ep.base_path.pop_back();
    }

    std::string port_str;
    if (StartsWith(s, "[")) {
        auto close = s.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("unterminated IPv6 address in backend URL: " + url);
        }
        ep.host = s.substr(1, close - 1);
        if (close + 1 < s.size()) {
            if (s[close + 1] != ':') {
                throw std::invalid_argument("malformed backend URL: " + url);
            }
            port_str = s.substr(close + 2);
        }
    } else {
        auto colon_pos = s.rfind(':');
        if (colon_pos != std::string::npos) {
            ep.host = s.substr(0, colon_pos);
            port_str = s.substr(colon_pos + 1);
        } else {
            ep.host = s;
        }
    }
    if (ep.host.empty()) {
        throw std::invalid_argument("backend URL has no host: " + url);
    }
    if (port_str.empty()) {
        ep.port = ep.scheme == "https" ? 443 : 80;
    } else {
        ep.port = ParsePort(port_str);
    }
    return ep;
}

auto LoadConfig(const EnvLookup& env) -> GatewayConfig {
    GatewayConfig cfg;
    cfg.backend = ParseBackendUrl(kDefaultBackendUrl);

    if (auto host = env("GATEWAY_HOST"); host && !host->empty()) cfg.listen_host = *host;
    if (auto port = env("GATEWAY_PORT"); port && !port->empty()) {
        try {
            cfg.listen_port = ParsePort(*port);
        } catch (const std::exception& e) {
            WarnIgnored("GATEWAY_PORT", *port, e.what());
        }
    }

    if (auto url = env("BACKEND_BASE_URL"); url && !url->empty()) {
        // A bad backend URL is fatal: every request would fail.
        cfg.backend = ParseBackendUrl(*url);
    }
    ReadPositiveInt(env, "BACKEND_CONNECT_TIMEOUT_SEC", &cfg.backend_connect_timeout_sec);
    ReadPositiveInt(env, "BACKEND_READ_TIMEOUT_SEC", &cfg.backend_read_timeout_sec);
    ReadPositiveInt(env, "BACKEND_WRITE_TIMEOUT_SEC", &cfg.backend_write_timeout_sec);

    if (auto project = env("TRACE_PROJECT_NAME"); project && !project->empty()) cfg.trace_project = *project;
    if (auto enabled = env("TRACE_ENABLED"); enabled && !enabled->empty()) {
        bool b = true;
        if (TryParseBool(*enabled, &b)) {
            cfg.trace_enabled = b;
        } else {
            WarnIgnored("TRACE_ENABLED", *enabled, "expected a boolean");
        }
    }
    if (auto level = env("LOG_LEVEL"); level && !level->empty()) cfg.log_level = ToLower(*level);
    return cfg;
}

auto LoadConfigFromEnv() -> GatewayConfig {
    return LoadConfig([](const char* name) -> std::optional<std::string> {
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
    });
}

auto ApplyArgs(GatewayConfig& cfg, const std::vector<std::string>& args) -> void {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string name = arg;
        std::optional<std::string> value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }
        if (name != "--host" && name != "--port") {
            throw std::invalid_argument("unknown argument: " + arg);
        }
        if (!value) {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("missing value for " + name);
            }
            value = args[++i];
        }
        if (name == "--host") {
            if (value->empty()) throw std::invalid_argument("empty value for --host");
            cfg.listen_host = *value;
        } else {
            cfg.listen_port = ParsePort(*value);
        }
    }
}

} // namespace chatgate
