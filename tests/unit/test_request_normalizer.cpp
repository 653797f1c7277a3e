#include <gtest/gtest.h>
#include "errors.h"
#include "request_normalizer.h"

namespace {

using namespace chatgate;

InboundRequest MakeRequest(const std::string& body) {
    InboundRequest req;
    req.method = "POST";
    req.path = "/v1/chat/completions";
    req.body = body;
    return req;
}

TEST(RequestNormalizerTest, AppliesDefaults) {
    auto chat = NormalizeChatRequest(MakeRequest(R"({"messages":[{"role":"user","content":"hi"}]})"));
    EXPECT_EQ(chat.model, "claude-3-5-haiku-20241022");
    EXPECT_DOUBLE_EQ(chat.temperature, 0.7);
    EXPECT_EQ(chat.max_tokens, 20);
    EXPECT_EQ(chat.credential, "");
    ASSERT_EQ(chat.messages.size(), 1u);
    EXPECT_EQ(chat.messages[0].role, "user");
    EXPECT_EQ(chat.messages[0].content, "hi");
}

TEST(RequestNormalizerTest, KeepsExplicitFields) {
    auto chat = NormalizeChatRequest(MakeRequest(
        R"({"model":"gpt-4o","temperature":0.1,"max_tokens":256,
            "messages":[{"role":"system","content":"be brief"},{"role":"user","content":"hi"}]})"));
    EXPECT_EQ(chat.model, "gpt-4o");
    EXPECT_DOUBLE_EQ(chat.temperature, 0.1);
    EXPECT_EQ(chat.max_tokens, 256);
    ASSERT_EQ(chat.messages.size(), 2u);
    EXPECT_EQ(chat.messages[0].role, "system");
}

TEST(RequestNormalizerTest, NullFieldsFallBackToDefaults) {
    auto chat = NormalizeChatRequest(MakeRequest(
        R"({"model":null,"temperature":null,"max_tokens":null,"messages":[{"role":"user","content":"x"}]})"));
    EXPECT_EQ(chat.model, kDefaultModel);
    EXPECT_DOUBLE_EQ(chat.temperature, kDefaultTemperature);
    EXPECT_EQ(chat.max_tokens, kDefaultMaxTokens);
}

TEST(RequestNormalizerTest, IntegerTemperatureIsAccepted) {
    auto chat = NormalizeChatRequest(MakeRequest(R"({"temperature":1,"messages":[{"role":"user","content":"x"}]})"));
    EXPECT_DOUBLE_EQ(chat.temperature, 1.0);
}

TEST(RequestNormalizerTest, NullContentBecomesEmptyString) {
    auto chat = NormalizeChatRequest(MakeRequest(R"({"messages":[{"role":"assistant","content":null}]})"));
    EXPECT_EQ(chat.messages[0].content, "");
}

TEST(RequestNormalizerTest, MissingMessagesIsRejected) {
    for (const std::string body : {"", "{}", R"({"model":"m"})", R"({"messages":[]})", R"({"messages":null})",
                                   R"({"messages":""})", R"({"messages":{}})", R"({"messages":false})"}) {
        try {
            NormalizeChatRequest(MakeRequest(body));
            FAIL() << "expected ValidationError for body: " << body;
        } catch (const ValidationError& e) {
            EXPECT_STREQ(e.what(), "Messages field is required") << body;
            EXPECT_EQ(e.kind(), ValidationError::Kind::MissingField);
        }
    }
}

TEST(RequestNormalizerTest, MalformedBodyBehavesLikeEmptyBody) {
    for (const std::string body : {"{ invalid json ", "not json at all", "[1,2,3]", "\"messages\"", "42"}) {
        EXPECT_EQ(ParseBodyLenient(body), nlohmann::json::object()) << body;
        EXPECT_THROW(NormalizeChatRequest(MakeRequest(body)), ValidationError) << body;
    }
}

TEST(RequestNormalizerTest, InvalidUtf8BodyIsLenient) {
    std::string body = "{\"messages\":\"\xff\xfe\"}";
    EXPECT_EQ(ParseBodyLenient(body), nlohmann::json::object());
}

TEST(RequestNormalizerTest, MalformedMessagesAreInvalidArguments) {
    struct Case {
        std::string body;
        std::string message;
    };
    std::vector<Case> cases = {
        {R"({"messages":"hello"})", "Messages field must be a list of messages"},
        {R"({"messages":[1]})", "Invalid message at index 0: expected an object"},
        {R"({"messages":[{"role":"user","content":"a"},{"content":"b"}]})", "Invalid message at index 1: role must be a string"},
        {R"({"messages":[{"role":"user","content":[{"type":"text"}]}]})", "Invalid message at index 0: content must be a string"},
        {R"({"model":5,"messages":[{"role":"user","content":"a"}]})", "model must be a string"},
        {R"({"temperature":"hot","messages":[{"role":"user","content":"a"}]})", "temperature must be a number"},
        {R"({"max_tokens":1.5,"messages":[{"role":"user","content":"a"}]})", "max_tokens must be an integer"},
        {R"({"max_tokens":3000000000,"messages":[{"role":"user","content":"a"}]})", "max_tokens must be an integer"},
        {R"({"max_tokens":18446744073709551615,"messages":[{"role":"user","content":"a"}]})", "max_tokens must be an integer"},
        {R"({"max_tokens":-3000000000,"messages":[{"role":"user","content":"a"}]})", "max_tokens must be an integer"},
    };
    for (const auto& c : cases) {
        try {
            NormalizeChatRequest(MakeRequest(c.body));
            FAIL() << "expected ValidationError for body: " << c.body;
        } catch (const ValidationError& e) {
            EXPECT_EQ(std::string(e.what()), c.message);
            EXPECT_EQ(e.kind(), ValidationError::Kind::InvalidArgument);
        }
    }
}

TEST(CredentialExtractionTest, StripsBearerPrefix) {
    EXPECT_EQ(ExtractCredential(std::string("Bearer abc123")), "abc123");
}

TEST(CredentialExtractionTest, PassesRawValueThrough) {
    EXPECT_EQ(ExtractCredential(std::string("abc123")), "abc123");
    EXPECT_EQ(ExtractCredential(std::string("bearer abc123")), "bearer abc123");
}

TEST(CredentialExtractionTest, StripsPrefixOnlyOnce) {
    EXPECT_EQ(ExtractCredential(std::string("Bearer Bearer x")), "Bearer x");
}

TEST(CredentialExtractionTest, AbsentHeaderIsEmpty) {
    EXPECT_EQ(ExtractCredential(std::nullopt), "");
}

TEST(CredentialExtractionTest, HeaderLookupIsCaseInsensitive) {
    auto req = MakeRequest(R"({"messages":[{"role":"user","content":"hi"}]})");
    req.headers.emplace("authorization", "Bearer abc123");
    EXPECT_EQ(NormalizeChatRequest(req).credential, "abc123");
}

TEST(RequestNormalizerTest, MaxTokensAtIntLimitIsKept) {
    auto chat = NormalizeChatRequest(MakeRequest(
        R"({"max_tokens":2147483647,"messages":[{"role":"user","content":"a"}]})"));
    EXPECT_EQ(chat.max_tokens, 2147483647);
}

} // namespace
