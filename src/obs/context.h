#pragma once

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace chatgate::obs {

// Request-scoped fields stamped onto every log line emitted on the serving thread.
struct Context {
    std::string request_id;
    std::string trace_id;
    std::string method;
    std::string path;
    std::string model;

    // Copies the non-empty fields into `out`, leaving keys it already has alone.
    void MergeInto(nlohmann::json& out) const {
        auto put = [&out](const char* key, const std::string& value) {
            if (!value.empty() && !out.contains(key)) {
                out[key] = value;
            }
        };
        put("request_id", request_id);
        put("trace_id", trace_id);
        put("method", method);
        put("path", path);
        put("model", model);
    }
};

namespace detail {
inline thread_local std::optional<Context> t_context;
} // namespace detail

// nullptr outside of a ScopedContext.
inline auto CurrentContext() -> const Context* {
    return detail::t_context ? &*detail::t_context : nullptr;
}

/**
 * @brief Installs a context for the current thread and restores the previous one on exit.
 *
 * Fields learned mid-request (model, trace id) are written through context().
 */
class ScopedContext {
public:
    explicit ScopedContext(Context ctx) : prev_(std::move(detail::t_context)) {
        detail::t_context = std::move(ctx);
    }

    ~ScopedContext() {
        detail::t_context = std::move(prev_);
    }

    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;

    auto context() -> Context& { return *detail::t_context; }

private:
    std::optional<Context> prev_;
};

} // namespace chatgate::obs
