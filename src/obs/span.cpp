#include "obs/span.h"
#include "obs/logging.h"
#include "obs/span_observer.h"

#include <exception>

namespace chatgate::obs {

void Span::Finish() {
    if (finished_) return;
    finished_ = true;
    record_.duration_ms = ElapsedMs();
    if (!observer_) return;
    try {
        observer_->OnSpanEnd(record_);
    } catch (const std::exception& e) {
        // Observers never change the outcome of the traced work.
        LogEvent(LogLevel::Warn, "span_observer_failed", "tracing",
                 {{"span", record_.name}, {"error", e.what()}});
    } catch (...) {
        // Finish runs from ~Span, so nothing may escape.
        LogEvent(LogLevel::Warn, "span_observer_failed", "tracing",
                 {{"span", record_.name}, {"error", "non-standard exception"}});
    }
}

LoggingSpanObserver::LoggingSpanObserver(std::string project_name)
    : project_name_(std::move(project_name)) {}

void LoggingSpanObserver::OnSpanEnd(const SpanRecord& span) {
    nlohmann::json fields;
    fields["project"] = project_name_;
    fields["span"] = span.name;
    fields["trace_id"] = span.context.trace_id;
    fields["span_id"] = span.context.span_id;
    if (!span.parent_span_id.empty()) {
        fields["parent_span_id"] = span.parent_span_id;
    }
    fields["duration_ms"] = span.duration_ms;
    fields["ok"] = span.ok;
    if (!span.status_message.empty()) {
        fields["status_message"] = span.status_message;
    }
    fields["attributes"] = span.attributes;
    LogEvent(span.ok ? LogLevel::Info : LogLevel::Warn, "span_end", "tracing", fields);
}

} // namespace chatgate::obs
