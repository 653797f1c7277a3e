#pragma once

namespace chatgate {
namespace obs {

inline constexpr const char* kErrHttpMissingField = "E_HTTP_MISSING_FIELD";
inline constexpr const char* kErrHttpInvalidArgument = "E_HTTP_INVALID_ARGUMENT";
inline constexpr const char* kErrHttpMethodNotAllowed = "E_HTTP_METHOD_NOT_ALLOWED";

inline constexpr const char* kErrBackendUnreachable = "E_BACKEND_UNREACHABLE";
inline constexpr const char* kErrBackendInvocation = "E_BACKEND_INVOCATION";
inline constexpr const char* kErrBackendNullResponse = "E_BACKEND_NULL_RESPONSE";

inline constexpr const char* kErrInternal = "E_INTERNAL";

} // namespace obs
} // namespace chatgate
