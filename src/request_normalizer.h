#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "types.h"

namespace chatgate {

inline constexpr const char* kMessagesRequired = "Messages field is required";

/**
 * @brief Parses a request body without ever failing.
 *
 * An empty body, a body that is not valid UTF-8 JSON, and a body whose top-level
 * value is not an object all yield an empty object.
 */
auto ParseBodyLenient(const std::string& body) -> nlohmann::json;

/**
 * @brief Strips one leading "Bearer " from an Authorization header value.
 *
 * Any other value passes through unchanged; an absent header yields "".
 */
auto ExtractCredential(const std::optional<std::string>& authorization) -> std::string;

/**
 * @brief Builds the canonical chat request from an inbound request.
 *
 * Applies defaults for model, temperature and max_tokens.
 * @throws ValidationError when messages is missing, empty or malformed, or when
 *         a supplied field has the wrong JSON type.
 */
auto NormalizeChatRequest(const InboundRequest& req) -> NormalizedChatRequest;

auto NormalizeChatRequest(const nlohmann::json& body, const std::optional<std::string>& authorization)
    -> NormalizedChatRequest;

} // namespace chatgate
