#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chatgate {

inline constexpr const char* kDefaultModel = "claude-3-5-haiku-20241022";
inline constexpr double kDefaultTemperature = 0.7;
inline constexpr int kDefaultMaxTokens = 20;

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

inline bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    CaseInsensitiveLess less;
    return !less(a, b) && !less(b, a);
}

struct InboundRequest {
    std::string method;
    std::string path;
    HeaderMap headers;
    std::string body;
    // Assigned by the transport layer; forwarded to the backend and logged.
    std::string request_id;

    auto Header(const std::string& name) const -> std::optional<std::string> {
        auto it = headers.find(name);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

struct ChatMessage {
    std::string role;
    std::string content;
};

inline bool operator==(const ChatMessage& a, const ChatMessage& b) {
    return a.role == b.role && a.content == b.content;
}

// Only built by NormalizeChatRequest, which guarantees messages is non-empty.
struct NormalizedChatRequest {
    std::string model = kDefaultModel;
    std::vector<ChatMessage> messages;
    double temperature = kDefaultTemperature;
    int max_tokens = kDefaultMaxTokens;
    std::string credential;
};

} // namespace chatgate
