#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace chatgate {

// A chat-completion document.
struct Structured {
    nlohmann::json mapping;
};

// Any other JSON object; its fields are passed through as-is.
struct FieldBag {
    nlohmann::json mapping;
};

// A value with no usable mapping shape.
struct Unrecognized {
    std::string reason;
};

using BackendResult = std::variant<Structured, FieldBag, Unrecognized>;

auto ResultKindName(const BackendResult& result) -> const char*;

/**
 * @brief Resolves a successful backend payload into a BackendResult.
 *
 * Returns std::nullopt when the payload carries no value at all (an empty or
 * whitespace-only body, or the JSON literal null).
 */
auto ResolveBackendPayload(const std::string& body) -> std::optional<BackendResult>;

} // namespace chatgate
