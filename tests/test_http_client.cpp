#include "network/http_client.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <chrono>
#include <mutex>
#include <thread>

using namespace powgate;
using namespace powgate::network;

TEST(BaseUrlTest, ParsesHostPortAndPrefix) {
    auto url = BaseUrl::parse("http://127.0.0.1:8000");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "127.0.0.1");
    EXPECT_EQ(url->port, 8000);
    EXPECT_EQ(url->path_prefix, "");
    EXPECT_EQ(url->host_header(), "127.0.0.1:8000");
    
    auto prefixed = BaseUrl::parse("http://api.example.test/v1/");
    ASSERT_TRUE(prefixed.has_value());
    EXPECT_EQ(prefixed->port, 80);
    EXPECT_EQ(prefixed->path_prefix, "/v1");
    EXPECT_EQ(prefixed->host_header(), "api.example.test");
    
    auto v6 = BaseUrl::parse("http://[::1]:8080");
    ASSERT_TRUE(v6.has_value());
    EXPECT_EQ(v6->host, "::1");
    EXPECT_EQ(v6->host_header(), "[::1]:8080");
}

TEST(BaseUrlTest, RejectsUnsupportedUrls) {
    EXPECT_FALSE(BaseUrl::parse("https://example.test").has_value());
    EXPECT_FALSE(BaseUrl::parse("http://").has_value());
    EXPECT_FALSE(BaseUrl::parse("http://host:notaport").has_value());
    EXPECT_FALSE(BaseUrl::parse("http://host:70000").has_value());
    EXPECT_FALSE(BaseUrl::parse("example.test").has_value());
}

TEST(HttpClientTest, UnsupportedBaseUrlFailsWithoutConnecting) {
    HttpClient client("https://secure.example.test", 1000);
    EXPECT_FALSE(client.base_url().has_value());
    
    HttpRequest request;
    request.path = "/users/challenge";
    auto response = client.send(request);
    ASSERT_TRUE(response.is_err());
    EXPECT_EQ(response.error().code(), ErrorCode::InvalidArgument);
}

TEST(HttpClientTest, UnreachableServerIsNetworkError) {
    // Port 1 on loopback refuses connections
    HttpClient client("http://127.0.0.1:1", 1000);
    
    HttpRequest request;
    request.path = "/users/challenge";
    auto response = client.send(request);
    ASSERT_TRUE(response.is_err());
    EXPECT_EQ(response.error().kind(), ErrorKind::Network);
}

// Local httplib server answering on an ephemeral loopback port
class HttpClientServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server.Get("/api/users/me", [](const httplib::Request& req, httplib::Response& res) {
            if (req.get_header_value("Authorization") != "Bearer good-token") {
                res.status = 401;
                res.set_content(R"({"detail": "Not authenticated"})", "application/json");
                return;
            }
            res.set_content(R"({"username": "alice"})", "application/json");
        });
        
        server.Post("/api/users/register", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(received_mutex);
            last_token = req.get_param_value("token");
            last_body = req.body;
            last_content_type = req.get_header_value("Content-Type");
            res.status = 201;
            res.set_header("X-Request-Id", "r-1");
            res.set_content(R"({"ok": true})", "application/json");
        });
        
        port = server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        server_thread = std::thread([this]() { server.listen_after_bind(); });
        
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!server.is_running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT_TRUE(server.is_running());
    }
    
    void TearDown() override {
        server.stop();
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }
    
    std::string base_url() const {
        return "http://127.0.0.1:" + std::to_string(port) + "/api";
    }
    
    httplib::Server server;
    std::thread server_thread;
    int port = 0;
    
    std::mutex received_mutex;
    std::string last_token;
    std::string last_body;
    std::string last_content_type;
};

TEST_F(HttpClientServerTest, GetWithBearerToken) {
    HttpClient client(base_url(), 2000);
    
    HttpRequest request;
    request.path = "/users/me";
    request.set_bearer_token("good-token");
    
    auto response = client.send(request);
    ASSERT_TRUE(response.is_ok()) << response.error().to_string();
    EXPECT_EQ(response.value().status, 200);
    EXPECT_EQ(response.value().body, R"({"username": "alice"})");
    EXPECT_EQ(response.value().header("CONTENT-TYPE").value_or(""), "application/json");
}

TEST_F(HttpClientServerTest, ErrorStatusIsStillAResponse) {
    HttpClient client(base_url(), 2000);
    
    HttpRequest request;
    request.path = "/users/me";
    request.set_bearer_token("expired");
    
    auto response = client.send(request);
    ASSERT_TRUE(response.is_ok());
    EXPECT_EQ(response.value().status, 401);
    EXPECT_FALSE(response.value().is_success());
}

TEST_F(HttpClientServerTest, PostWithQueryAndJsonBody) {
    HttpClient client(base_url(), 2000);
    
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.path = "/users/register?token=" + url_encode("a+b/c=");
    request.set_json_body(R"({"username": "alice"})");
    
    auto response = client.send(request);
    ASSERT_TRUE(response.is_ok()) << response.error().to_string();
    EXPECT_EQ(response.value().status, 201);
    EXPECT_EQ(response.value().header("x-request-id").value_or(""), "r-1");
    
    std::lock_guard<std::mutex> lock(received_mutex);
    EXPECT_EQ(last_token, "a+b/c=");
    EXPECT_EQ(last_body, R"({"username": "alice"})");
    EXPECT_EQ(last_content_type, "application/json");
}
