#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "api_server.h"
#include "gateway_handler.h"
#include "http_backend_client.h"
#include "http_test_utils.h"

#include <memory>
#include <string>
#include <thread>

using namespace chatgate;

// Starts the gateway on a free port. The backend points at a port nothing listens on.
class ApiHealthTest : public ::testing::Test {
protected:
    void SetUp() override {
        BackendEndpoint backend;
        backend.host = "127.0.0.1";
        backend.port = AllocateTestPort();
        HttpBackendClient::Timeouts timeouts;
        timeouts.connect_sec = 1;
        auto handler = std::make_shared<GatewayHandler>(std::make_shared<HttpBackendClient>(backend, timeouts));
        server = std::make_unique<api::ApiServer>(handler);

        port = AllocateTestPort();
        thread = std::thread([this]() { server->Start("127.0.0.1", port); });
        if (!WaitForServerReady("127.0.0.1", port)) {
            GTEST_SKIP() << "gateway did not start on port " << port;
        }
        client = std::make_unique<httplib::Client>("127.0.0.1", port);
        client->set_connection_timeout(2, 0);
        client->set_read_timeout(5, 0);
    }

    void TearDown() override {
        client.reset();
        if (server) server->Stop();
        if (thread.joinable()) thread.join();
    }

    std::unique_ptr<api::ApiServer> server;
    std::unique_ptr<httplib::Client> client;
    std::thread thread;
    int port = 0;
};

TEST_F(ApiHealthTest, HealthReturnsHealthy) {
    auto res = client->Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j, (nlohmann::json{{"status", "healthy"}}));
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_FALSE(res->get_header_value("X-Request-ID").empty());
}

TEST_F(ApiHealthTest, RequestIdIsEchoed) {
    httplib::Headers headers = {{"X-Request-ID", "test-request-id"}};
    auto res = client->Get("/health", headers);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->get_header_value("X-Request-ID"), "test-request-id");
}

TEST_F(ApiHealthTest, PreflightEchoesOrigin) {
    httplib::Headers headers = {{"Origin", "http://app.example.com"},
                                {"Access-Control-Request-Method", "POST"},
                                {"Access-Control-Request-Headers", "authorization,content-type"}};
    auto res = client->Options("/v1/chat/completions", headers);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "http://app.example.com");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Methods"), "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Headers"), "authorization,content-type");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Credentials"), "true");
    EXPECT_EQ(res->get_header_value("Access-Control-Max-Age"), "600");
}

TEST_F(ApiHealthTest, OptionsWithoutPreflightHeadersIsNotAllowed) {
    // No Access-Control-Request-Method: not a preflight.
    httplib::Headers with_origin = {{"Origin", "http://app.example.com"}};
    auto res = client->Options("/v1/chat/completions", with_origin);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 405);
    EXPECT_EQ(nlohmann::json::parse(res->body)["detail"], "Method Not Allowed");
    EXPECT_EQ(res->get_header_value("Allow"), "DELETE, GET, PATCH, POST, PUT");
    EXPECT_FALSE(res->has_header("Access-Control-Max-Age"));
    EXPECT_FALSE(res->has_header("Access-Control-Allow-Credentials"));

    // No Origin: not a preflight either.
    httplib::Headers with_method = {{"Access-Control-Request-Method", "POST"}};
    auto bare = client->Options("/v1/chat/completions", with_method);
    ASSERT_TRUE(bare);
    EXPECT_EQ(bare->status, 405);
}

TEST_F(ApiHealthTest, UnreachableBackendIs502) {
    auto res = client->Post("/v1/chat/completions", R"({"messages":[{"role":"user","content":"hi"}]})",
                            "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 502);
    auto j = nlohmann::json::parse(res->body);
    ASSERT_TRUE(j.contains("detail"));
    EXPECT_EQ(j["detail"].get<std::string>().rfind("Error connecting to backend server: ", 0), 0u);
}

TEST_F(ApiHealthTest, MissingMessagesIs400EvenWhenBackendIsDown) {
    auto res = client->Post("/v1/chat/completions", R"({"model":"x"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["detail"], "Messages field is required");
}
