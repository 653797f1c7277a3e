#pragma once

// W3C Trace Context plus an RAII span that reports to a SpanObserver.
//
// traceparent: 00-<trace-id(32 hex)>-<parent-id(16 hex)>-<flags(2 hex)>
// https://www.w3.org/TR/trace-context/

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace chatgate::obs {

struct SpanContext {
    std::string trace_id;  // 32 lowercase hex chars
    std::string span_id;   // 16 lowercase hex chars

    bool valid() const { return trace_id.size() == 32 && span_id.size() == 16; }

    std::string ToTraceparent() const {
        if (!valid()) return {};
        return "00-" + trace_id + "-" + span_id + "-01";
    }
};

namespace tracing {

namespace detail {
inline uint64_t RandomU64() {
    static thread_local std::mt19937_64 rng{
        static_cast<uint64_t>(
            std::chrono::steady_clock::now().time_since_epoch().count())};
    return rng();
}

inline bool IsLowerHex(const std::string& s) {
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool alpha = c >= 'a' && c <= 'f';
        if (!digit && !alpha) return false;
    }
    return true;
}

inline bool IsAllZero(const std::string& s) {
    return s.find_first_not_of('0') == std::string::npos;
}
}  // namespace detail

// `bytes` must be a multiple of 8.
inline std::string RandomHex(std::size_t bytes) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < bytes / 8; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(16) << detail::RandomU64();
    }
    return oss.str();
}

inline SpanContext NewContext() {
    return SpanContext{RandomHex(16), RandomHex(8)};
}

// Inherits the parent's trace id; starts a new trace when the parent is invalid.
inline SpanContext ChildContext(const SpanContext& parent) {
    std::string tid = parent.valid() ? parent.trace_id : RandomHex(16);
    return SpanContext{tid, RandomHex(8)};
}

// Returns an invalid context on any malformed input.
inline SpanContext ParseTraceparent(const std::string& header) {
    SpanContext ctx;
    if (header.size() < 55) return ctx;
    auto p1 = header.find('-');
    if (p1 != 2) return ctx;
    auto p2 = header.find('-', p1 + 1);
    if (p2 == std::string::npos) return ctx;
    auto p3 = header.find('-', p2 + 1);
    if (p3 == std::string::npos) return ctx;
    auto version = header.substr(0, p1);
    if (version == "ff" || !detail::IsLowerHex(version)) return ctx;
    ctx.trace_id = header.substr(p1 + 1, p2 - p1 - 1);
    ctx.span_id = header.substr(p2 + 1, p3 - p2 - 1);
    if (!ctx.valid() ||
        !detail::IsLowerHex(ctx.trace_id) || !detail::IsLowerHex(ctx.span_id) ||
        detail::IsAllZero(ctx.trace_id) || detail::IsAllZero(ctx.span_id)) {
        ctx = {};
    }
    return ctx;
}

}  // namespace tracing

struct SpanRecord {
    std::string name;
    SpanContext context;
    std::string parent_span_id;
    double duration_ms = 0.0;
    bool ok = true;
    std::string status_message;
    nlohmann::json attributes = nlohmann::json::object();
};

// Receives finished spans. Implementations must be thread-safe; the gateway
// calls them from HTTP worker threads.
class SpanObserver {
public:
    virtual ~SpanObserver() = default;
    virtual void OnSpanEnd(const SpanRecord& span) = 0;
};

// Times a named unit of work and hands the record to the observer exactly once.
// A null observer makes the span a plain timer.
class Span {
public:
    Span(std::string name, SpanContext context, std::string parent_span_id, SpanObserver* observer)
        : observer_(observer),
          start_(std::chrono::steady_clock::now()) {
        record_.name = std::move(name);
        record_.context = std::move(context);
        record_.parent_span_id = std::move(parent_span_id);
    }

    ~Span() { Finish(); }

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    void SetAttribute(const std::string& key, nlohmann::json value) {
        record_.attributes[key] = std::move(value);
    }

    void SetError(const std::string& message) {
        record_.ok = false;
        record_.status_message = message;
    }

    void Finish();

    double ElapsedMs() const {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    SpanObserver* observer_;
    SpanRecord record_;
    std::chrono::steady_clock::time_point start_;
    bool finished_ = false;
};

} // namespace chatgate::obs
