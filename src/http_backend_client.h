#pragma once

#include <memory>
#include <optional>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "gateway_config.h"
#include "ibackend_client.h"

namespace chatgate {

/**
 * @brief Calls an OpenAI-compatible chat-completion endpoint over HTTP.
 *
 * Every call opens its own client, which is closed when the call returns or throws.
 */
class HttpBackendClient : public IBackendClient {
public:
    struct Timeouts {
        int connect_sec = 10;
        int read_sec = 600;
        int write_sec = 30;
    };

    HttpBackendClient(BackendEndpoint endpoint, Timeouts timeouts);

    auto ChatCompletion(const NormalizedChatRequest& req, const CallContext& ctx)
        -> std::optional<BackendResult> override;

    auto Target() const -> std::string override;

    static auto BuildRequestBody(const NormalizedChatRequest& req) -> nlohmann::json;
    static auto DescribeHttpFailure(int status, const std::string& body) -> std::string;

    static constexpr const char* kChatCompletionsPath = "/v1/chat/completions";

private:
    auto MakeClient() const -> std::unique_ptr<httplib::Client>;

    BackendEndpoint endpoint_;
    Timeouts timeouts_;
};

} // namespace chatgate
