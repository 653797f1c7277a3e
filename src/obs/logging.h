#pragma once

#include <chrono>
#include <ctime>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/chrono.h>
#include <spdlog/spdlog.h>

#include "obs/context.h"

namespace chatgate {
namespace obs {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

inline const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

inline spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
    }
    return spdlog::level::info;
}

// UTC, millisecond precision, e.g. 2024-05-01T12:00:00.123Z.
inline std::string NowIso8601() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", tm, ms);
}

inline void LogEvent(LogLevel level,
                     const std::string& event,
                     const std::string& component,
                     const nlohmann::json& fields = nlohmann::json::object()) {
    const auto spd_level = ToSpdlogLevel(level);
    if (!spdlog::default_logger_raw()->should_log(spd_level)) return;

    nlohmann::json j = fields.is_object() ? fields : nlohmann::json::object();
    if (const auto* ctx = CurrentContext()) {
        // Explicit fields win over context fields.
        ctx->MergeInto(j);
    }
    j["ts"] = NowIso8601();
    j["level"] = LevelToString(level);
    j["event"] = event;
    j["component"] = component;

    // Replace invalid UTF-8 coming from request bodies instead of throwing.
    spdlog::log(spd_level, "{}", j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

inline std::string TruncateForLog(std::string s, size_t max_chars) {
    static const std::string kSuffix = "...(truncated)";
    if (s.size() <= max_chars) return s;
    if (max_chars <= kSuffix.size()) return kSuffix.substr(0, max_chars);
    s.resize(max_chars - kSuffix.size());
    s += kSuffix;
    return s;
}

} // namespace obs
} // namespace chatgate
