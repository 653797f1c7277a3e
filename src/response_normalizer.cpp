#include "response_normalizer.h"

#include <type_traits>

namespace chatgate {

namespace {

auto ErrorBody(const char* reason) -> nlohmann::json {
    return nlohmann::json{{"error", reason}};
}

auto FromMapping(const nlohmann::json& mapping) -> nlohmann::json {
    if (mapping.is_null()) {
        return ErrorBody(kEmptyResponse);
    }
    if (!mapping.is_object()) {
        return ErrorBody(kInvalidResponseFormat);
    }
    return mapping;
}

} // namespace

auto NormalizeResponse(const BackendResult& result) noexcept -> nlohmann::json {
    return std::visit([](const auto& r) -> nlohmann::json {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, Unrecognized>) {
            return ErrorBody(kInvalidResponseFormat);
        } else {
            return FromMapping(r.mapping);
        }
    }, result);
}

} // namespace chatgate
