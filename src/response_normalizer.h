#pragma once

#include <nlohmann/json.hpp>

#include "backend_result.h"

namespace chatgate {

inline constexpr const char* kInvalidResponseFormat = "Invalid response format from backend";
inline constexpr const char* kEmptyResponse = "Empty response from backend";

/**
 * @brief Converts a backend result into the client-facing body.
 *
 * Always returns a JSON object. Results without a usable mapping degrade to
 * {"error": "..."} instead of failing.
 */
auto NormalizeResponse(const BackendResult& result) noexcept -> nlohmann::json;

} // namespace chatgate
