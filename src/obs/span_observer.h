#pragma once

#include <string>

#include "obs/span.h"

namespace chatgate::obs {

// Reports finished spans as structured "span_end" log events.
class LoggingSpanObserver : public SpanObserver {
public:
    explicit LoggingSpanObserver(std::string project_name);

    void OnSpanEnd(const SpanRecord& span) override;

private:
    std::string project_name_;
};

} // namespace chatgate::obs
