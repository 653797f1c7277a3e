#pragma once

#include <gmock/gmock.h>

#include <optional>
#include <string>

#include "ibackend_client.h"

class MockBackendClient : public chatgate::IBackendClient {
public:
    MOCK_METHOD(std::optional<chatgate::BackendResult>, ChatCompletion,
                (const chatgate::NormalizedChatRequest& req, const chatgate::CallContext& ctx), (override));
    MOCK_METHOD(std::string, Target, (), (const, override));
};
