#include "request_normalizer.h"

#include "errors.h"
#include "obs/logging.h"

#include <cstdint>
#include <limits>

namespace chatgate {

namespace {

constexpr const char* kBearerPrefix = "Bearer ";

// Values a client sends when it means "no messages".
bool IsEmptyValue(const nlohmann::json& v) {
    if (v.is_null()) return true;
    if (v.is_string()) return v.get_ref<const std::string&>().empty();
    if (v.is_array() || v.is_object()) return v.empty();
    if (v.is_boolean()) return !v.get<bool>();
    if (v.is_number()) return v.get<double>() == 0.0;
    return false;
}

// get<int>() narrows silently; out-of-range integers are rejected instead.
bool FitsInInt(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        return v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    }
    auto n = v.get<std::int64_t>();
    return n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max();
}

auto ParseMessage(const nlohmann::json& m, size_t index) -> ChatMessage {
    auto fail = [index](const std::string& reason) {
        return ValidationError("Invalid message at index " + std::to_string(index) + ": " + reason,
                               ValidationError::Kind::InvalidArgument);
    };
    if (!m.is_object()) {
        throw fail("expected an object");
    }
    ChatMessage out;
    auto role = m.find("role");
    if (role == m.end() || !role->is_string()) {
        throw fail("role must be a string");
    }
    out.role = role->get<std::string>();

    auto content = m.find("content");
    if (content != m.end() && !content->is_null()) {
        if (!content->is_string()) {
            throw fail("content must be a string");
        }
        out.content = content->get<std::string>();
    }
    return out;
}

} // namespace

auto ParseBodyLenient(const std::string& body) -> nlohmann::json {
    if (body.empty()) {
        return nlohmann::json::object();
    }
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        obs::LogEvent(obs::LogLevel::Warn, "request_body_unparseable", "normalizer",
                      {{"body_bytes", body.size()}});
        return nlohmann::json::object();
    }
    if (!j.is_object()) {
        obs::LogEvent(obs::LogLevel::Warn, "request_body_not_object", "normalizer",
                      {{"json_type", j.type_name()}});
        return nlohmann::json::object();
    }
    return j;
}

auto ExtractCredential(const std::optional<std::string>& authorization) -> std::string {
    if (!authorization) {
        return "";
    }
    const std::string& value = *authorization;
    const std::string prefix = kBearerPrefix;
    if (value.compare(0, prefix.size(), prefix) == 0) {
        return value.substr(prefix.size());
    }
    return value;
}

auto NormalizeChatRequest(const nlohmann::json& body, const std::optional<std::string>& authorization)
    -> NormalizedChatRequest {
    auto messages = body.find("messages");
    if (messages == body.end() || IsEmptyValue(*messages)) {
        throw ValidationError(kMessagesRequired);
    }
    if (!messages->is_array()) {
        throw ValidationError("Messages field must be a list of messages",
                              ValidationError::Kind::InvalidArgument);
    }

    NormalizedChatRequest out;
    out.messages.reserve(messages->size());
    for (size_t i = 0; i < messages->size(); ++i) {
        out.messages.push_back(ParseMessage((*messages)[i], i));
    }

    auto model = body.find("model");
    if (model != body.end() && !model->is_null()) {
        if (!model->is_string()) {
            throw ValidationError("model must be a string", ValidationError::Kind::InvalidArgument);
        }
        out.model = model->get<std::string>();
    }

    auto temperature = body.find("temperature");
    if (temperature != body.end() && !temperature->is_null()) {
        if (!temperature->is_number()) {
            throw ValidationError("temperature must be a number", ValidationError::Kind::InvalidArgument);
        }
        out.temperature = temperature->get<double>();
    }

    auto max_tokens = body.find("max_tokens");
    if (max_tokens != body.end() && !max_tokens->is_null()) {
        if (!max_tokens->is_number_integer() || !FitsInInt(*max_tokens)) {
            throw ValidationError("max_tokens must be an integer", ValidationError::Kind::InvalidArgument);
        }
        out.max_tokens = max_tokens->get<int>();
    }

    out.credential = ExtractCredential(authorization);
    return out;
}

auto NormalizeChatRequest(const InboundRequest& req) -> NormalizedChatRequest {
    return NormalizeChatRequest(ParseBodyLenient(req.body), req.Header("Authorization"));
}

} // namespace chatgate
