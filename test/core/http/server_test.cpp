/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "http/server.hpp"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include "http/http_error.hpp"
#include "http/impl/http_client_impl.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace nineteen;
using namespace std::chrono_literals;

namespace bhttp = boost::beast::http;

/// Answers with the method, target and body of the request
class EchoHandler : public http::RequestHandler {
 public:
  void onSessionRequest(http::Session::Request request,
                        std::shared_ptr<http::Session> session) override {
    auto body = fmt::format("{} {} {}",
                            std::string{request.method_string()},
                            std::string{request.target()},
                            request.body());
    session->respond(http::makeResponse(
        request, bhttp::status::accepted, std::move(body), "text/plain"));
  }
};

class HttpServerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    http::Server::Configuration config{
        .endpoint = {boost::asio::ip::make_address("127.0.0.1"), 0}};
    server_ = std::make_shared<http::Server>(
        "test", config, std::make_shared<EchoHandler>());
    ASSERT_TRUE(server_->prepare());
    ASSERT_NE(server_->port(), 0);
    ASSERT_TRUE(server_->start());
  }

  void TearDown() override {
    server_->stop();
  }

  std::string url(std::string_view path) const {
    return fmt::format("http://127.0.0.1:{}{}", server_->port(), path);
  }

  std::shared_ptr<http::Server> server_;
  http::HttpClientImpl client_;
};

/**
 * @given server on a free port
 * @when client posts to it
 * @then handler answer comes back with its status
 */
TEST_F(HttpServerTest, PostRoundTrip) {
  http::HttpRequest request{.url = url("/chat-llama-3-2-3b"), .body = "{}"};
  ASSERT_OUTCOME_SUCCESS(response, client_.send(request, 2s));
  EXPECT_EQ(response.status, 202);
  EXPECT_TRUE(response.isSuccess());
  EXPECT_EQ(response.body, "POST /chat-llama-3-2-3b {}");
}

TEST_F(HttpServerTest, GetWithQuery) {
  http::HttpRequest request{.method = http::HttpMethod::Get,
                            .url = url("/status?id=7")};
  ASSERT_OUTCOME_SUCCESS(response, client_.send(request, 2s));
  EXPECT_EQ(response.body, "GET /status?id=7 ");
}

/**
 * @given stopped server
 * @when client sends to its port
 * @then connection fails
 */
TEST_F(HttpServerTest, StoppedServerRefuses) {
  auto address = url("/");
  server_->stop();
  http::HttpRequest request{.url = address};
  EXPECT_EC(client_.send(request, 2s), http::HttpError::CONNECTION_FAILED);
}

TEST_F(HttpServerTest, ClientRejectsBadUrl) {
  EXPECT_EC(client_.send({.url = "https://127.0.0.1/"}, 1s),
            http::HttpError::INVALID_URI);
  EXPECT_EC(client_.send({.url = "http://127.0.0.1:99999/"}, 1s),
            http::HttpError::INVALID_URI);
}

/**
 * @given second server on the port of the first one
 * @when prepare it
 * @then bind fails
 */
TEST_F(HttpServerTest, PortInUse) {
  http::Server::Configuration config{
      .endpoint = {boost::asio::ip::make_address("127.0.0.1"),
                   server_->port()}};
  auto second = std::make_shared<http::Server>(
      "second", config, std::make_shared<EchoHandler>());
  EXPECT_FALSE(second->prepare());
}
