#pragma once

#include <optional>
#include <string>

#include "backend_result.h"
#include "types.h"

namespace chatgate {

// Per-call metadata forwarded to the backend alongside the request.
struct CallContext {
    std::string request_id;
    std::string traceparent;
};

class IBackendClient {
public:
    virtual ~IBackendClient() = default;

    // Issues exactly one chat-completion call.
    // Throws TransportError when the backend cannot be reached and
    // InvocationError for any other failure. std::nullopt means the call
    // succeeded without producing a value.
    virtual auto ChatCompletion(const NormalizedChatRequest& req, const CallContext& ctx)
        -> std::optional<BackendResult> = 0;

    // Human-readable target used in logs, e.g. "http://localhost:4000".
    virtual auto Target() const -> std::string = 0;
};

} // namespace chatgate
