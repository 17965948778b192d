/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/impl/gateway_http_handler.hpp"

#include <gtest/gtest.h>

#include <thread>

#include "cache/cache_keys.hpp"
#include "cache/in_memory/in_memory_cache.hpp"
#include "common/json.hpp"
#include "dispatch/messages.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "storage/in_memory/in_memory_repositories.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using namespace nineteen;  // NOLINT
using gateway::GatewayHttpHandler;
using primitives::TaskStatus;
using primitives::TaskType;

namespace bhttp = boost::beast::http;

namespace {
  const std::string kChat = "chat-llama-3-2-3b";
  const std::string kKey = "key-1";
}  // namespace

class GatewayHttpHandlerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ASSERT_TRUE(gateway->prepare());
  }

  http::Session::Request request(bhttp::verb method,
                                 std::string target,
                                 std::string body = {},
                                 std::optional<std::string> api_key = kKey) {
    http::Session::Request req{method, target, 11};
    if (api_key) {
      constexpr auto header = GatewayHttpHandler::kApiKeyHeader;
      req.set(boost::beast::string_view{header.data(), header.size()},
              *api_key);
    }
    req.body() = std::move(body);
    req.prepare_payload();
    return req;
  }

  http::Session::Response submit(std::string body,
                                 std::optional<std::string> api_key = kKey) {
    return handler.handle(request(bhttp::verb::post,
                                  "/v1/tasks/" + kChat,
                                  std::move(body),
                                  std::move(api_key)));
  }

  static rapidjson::Document json(const http::Session::Response &response) {
    rapidjson::Document doc;
    doc.Parse(response.body().data(), response.body().size());
    EXPECT_FALSE(doc.HasParseError()) << response.body();
    return doc;
  }

  static std::string error(const http::Session::Response &response) {
    return common::getString(json(response), "error").value_or("");
  }

  /// Answers the next queued task with \param status
  std::thread answerNext(TaskStatus status) {
    return std::thread([this, status] {
      auto entry = queue->next(5s);
      if (entry.has_value() and entry.value()) {
        primitives::TaskResult result{
            .task_id = entry.value()->task_id,
            .status = status,
            .participant = "a",
            .latency = 250ms,
            .quality = 0.875,
            .response = R"({"text":"hello"})",
        };
        EXPECT_OUTCOME_TRUE_1(
            cache->publish(cache::keys::kTaskResultsChannel,
                           dispatch::encodeTaskResult(result)));
      }
    });
  }

  std::shared_ptr<clock::ManualClock> clock =
      std::make_shared<clock::ManualClock>();
  std::shared_ptr<cache::InMemoryCache> cache =
      std::make_shared<cache::InMemoryCache>(
          std::make_shared<clock::ManualSteadyClock>());
  std::shared_ptr<storage::InMemoryTaskRepository> tasks =
      std::make_shared<storage::InMemoryTaskRepository>();
  std::shared_ptr<dispatch::TaskQueue> queue =
      std::make_shared<dispatch::TaskQueue>(
          dispatch::QueueConfig{.capacity = 1}, tasks, cache, clock);
  std::shared_ptr<gateway::IntakeGateway> gateway =
      std::make_shared<gateway::IntakeGateway>(
          gateway::GatewayConfig{
              .api_keys = {kKey},
              .rate_limit_per_minute = 5,
              .min_timeout = 10ms,
          },
          std::vector<TaskType>{TaskType{.name = kChat, .timeout = 5s}},
          queue,
          cache,
          std::make_shared<gateway::ResultWaiter>(cache),
          clock);
  GatewayHttpHandler handler{gateway, 1};
};

TEST_F(GatewayHttpHandlerTest, Health) {
  auto response = handler.handle(request(bhttp::verb::get, "/health"));
  EXPECT_EQ(response.result(), bhttp::status::ok);
  EXPECT_EQ(response.body(), R"({"status":"ok"})");
  EXPECT_EQ(response[bhttp::field::content_type], "application/json");

  auto post = handler.handle(request(bhttp::verb::post, "/health"));
  EXPECT_EQ(post.result(), bhttp::status::method_not_allowed);
}

/**
 * @given requests to unknown paths or with a wrong method
 * @when handled
 * @then they are refused before reaching the gateway
 */
TEST_F(GatewayHttpHandlerTest, Routing) {
  EXPECT_EQ(handler.handle(request(bhttp::verb::get, "/")).result(),
            bhttp::status::not_found);
  EXPECT_EQ(handler.handle(request(bhttp::verb::post, "/v1/tasks/")).result(),
            bhttp::status::not_found);
  EXPECT_EQ(
      handler.handle(request(bhttp::verb::post, "/v1/tasks/a/b")).result(),
      bhttp::status::not_found);
  EXPECT_EQ(
      handler.handle(request(bhttp::verb::get, "/v1/tasks/" + kChat)).result(),
      bhttp::status::method_not_allowed);
}

/**
 * @given malformed bodies
 * @when submitted
 * @then each gets 400 rejected
 */
TEST_F(GatewayHttpHandlerTest, MalformedBody) {
  for (auto body : {"", "{", "[]", R"({"payload":1})", R"({"wait":false})",
                    R"({"payload":"x","timeout_ms":"soon"})"}) {
    auto response = submit(body);
    EXPECT_EQ(response.result(), bhttp::status::bad_request) << body;
    EXPECT_EQ(error(response), "rejected") << body;
  }
  EXPECT_OUTCOME_TRUE(length, queue->length());
  EXPECT_EQ(length, 0u);
}

TEST_F(GatewayHttpHandlerTest, Unauthorized) {
  auto missing = submit(R"({"payload":"x","wait":false})", std::nullopt);
  EXPECT_EQ(missing.result(), bhttp::status::unauthorized);
  EXPECT_EQ(error(missing), "rejected");

  auto wrong = submit(R"({"payload":"x","wait":false})", "key-2");
  EXPECT_EQ(wrong.result(), bhttp::status::unauthorized);
}

/**
 * @given a request that does not wait
 * @when it is queued
 * @then 202 carries the task id, a second one finds the queue full
 */
TEST_F(GatewayHttpHandlerTest, AcceptedThenOverloaded) {
  auto accepted = submit(R"({"payload":"x","wait":false})");
  EXPECT_EQ(accepted.result(), bhttp::status::accepted);
  auto body = json(accepted);
  EXPECT_EQ(common::getString(body, "status"), "accepted");
  auto task_id = common::getString(body, "task_id");
  ASSERT_TRUE(task_id.has_value());
  EXPECT_OUTCOME_TRUE(stored, tasks->get(*task_id));
  EXPECT_TRUE(stored.has_value());

  auto overloaded = submit(R"({"payload":"x","wait":false})");
  EXPECT_EQ(overloaded.result(), bhttp::status::service_unavailable);
  EXPECT_EQ(error(overloaded), "overloaded");
}

TEST_F(GatewayHttpHandlerTest, RateLimited) {
  for (auto i = 0; i < 5; ++i) {
    submit(R"({"payload":""})");
  }
  auto limited = submit(R"({"payload":"x","wait":false})");
  EXPECT_EQ(limited.result(), bhttp::status::too_many_requests);
  EXPECT_EQ(error(limited), "overloaded");
}

/**
 * @given a waiting request
 * @when a router completes the task
 * @then 200 carries the worker response and its metadata
 */
TEST_F(GatewayHttpHandlerTest, Completed) {
  auto router = answerNext(TaskStatus::Completed);
  auto response = submit(R"({"payload":"x"})");
  router.join();

  EXPECT_EQ(response.result(), bhttp::status::ok);
  auto body = json(response);
  EXPECT_EQ(common::getString(body, "status"), "completed");
  EXPECT_EQ(common::getString(body, "participant"), "a");
  EXPECT_EQ(common::getInt64(body, "latency_ms"), 250);
  EXPECT_EQ(common::getDouble(body, "quality"), 0.875);
  EXPECT_EQ(common::getString(body, "response"), R"({"text":"hello"})");
}

/**
 * @given a waiting request
 * @when the task fails
 * @then 502 carries only the final status
 */
TEST_F(GatewayHttpHandlerTest, Failed) {
  auto router = answerNext(TaskStatus::Failed);
  auto response = submit(R"({"payload":"x"})");
  router.join();

  EXPECT_EQ(response.result(), bhttp::status::bad_gateway);
  auto body = json(response);
  EXPECT_EQ(common::getString(body, "status"), "failed");
  EXPECT_FALSE(body.HasMember("response"));
  EXPECT_FALSE(body.HasMember("participant"));
}

TEST_F(GatewayHttpHandlerTest, Timeout) {
  auto response = submit(R"({"payload":"x","timeout_ms":50})");
  EXPECT_EQ(response.result(), bhttp::status::gateway_timeout);
  EXPECT_EQ(error(response), "timeout");
}
