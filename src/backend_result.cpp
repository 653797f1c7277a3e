#include "backend_result.h"

namespace chatgate {

auto ResultKindName(const BackendResult& result) -> const char* {
    if (std::holds_alternative<Structured>(result)) return "structured";
    if (std::holds_alternative<FieldBag>(result)) return "field_bag";
    return "unrecognized";
}

auto ResolveBackendPayload(const std::string& body) -> std::optional<BackendResult> {
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return BackendResult{Unrecognized{"body is not JSON"}};
    }
    if (j.is_null()) {
        return std::nullopt;
    }
    if (!j.is_object()) {
        return BackendResult{Unrecognized{std::string("top-level JSON ") + j.type_name()}};
    }
    if (j.contains("choices")) {
        return BackendResult{Structured{std::move(j)}};
    }
    return BackendResult{FieldBag{std::move(j)}};
}

} // namespace chatgate
