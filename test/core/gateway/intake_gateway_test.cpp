/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/intake_gateway.hpp"

#include <gtest/gtest.h>

#include <thread>

#include "cache/cache_keys.hpp"
#include "cache/in_memory/in_memory_cache.hpp"
#include "dispatch/messages.hpp"
#include "gateway/gateway_error.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "storage/in_memory/in_memory_repositories.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using namespace nineteen;  // NOLINT
using gateway::GatewayError;
using gateway::SubmitRequest;
using primitives::TaskKind;
using primitives::TaskResult;
using primitives::TaskStatus;
using primitives::TaskType;

namespace {
  const std::string kChat = "chat-llama-3-2-3b";
  const std::string kKey = "key-1";
}  // namespace

class IntakeGatewayTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ASSERT_TRUE(gateway->prepare());
  }

  SubmitRequest request(bool wait = false) {
    return SubmitRequest{
        .api_key = kKey,
        .task_type = kChat,
        .payload = R"({"messages":[{"role":"user","content":"hi"}]})",
        .wait = wait,
    };
  }

  size_t queueLength() {
    auto res = queue->length();
    EXPECT_TRUE(res.has_value());
    return res.value();
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
          dispatch::QueueConfig{.capacity = 2}, tasks, cache, clock);
  std::shared_ptr<gateway::ResultWaiter> waiter =
      std::make_shared<gateway::ResultWaiter>(cache);

  gateway::GatewayConfig config{
      .api_keys = {kKey},
      .rate_limit_per_minute = 3,
      .min_timeout = 10ms,
      .max_timeout = 1min,
  };
  std::vector<TaskType> task_types{
      TaskType{.name = kChat, .capacity_per_participant = 10., .timeout = 5s},
      TaskType{.name = "disabled", .enabled = false},
  };
  std::shared_ptr<gateway::IntakeGateway> gateway =
      std::make_shared<gateway::IntakeGateway>(
          config, task_types, queue, cache, waiter, clock);
};

/**
 * @given a known api key
 * @when a task is submitted without waiting
 * @then it is stored and queued as an organic task with the task type's
 * timeout and one request is taken from the synthetic budget
 */
TEST_F(IntakeGatewayTest, Accepted) {
  EXPECT_OUTCOME_TRUE_1(cache->set(
      cache::keys::syntheticRemaining(kChat), "5", std::nullopt));

  EXPECT_OUTCOME_TRUE(response, gateway->submit(request()));
  EXPECT_FALSE(response.task_id.empty());
  EXPECT_FALSE(response.result.has_value());

  EXPECT_OUTCOME_TRUE(stored, tasks->get(response.task_id));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->kind, TaskKind::Organic);
  EXPECT_EQ(stored->task_type, kChat);
  EXPECT_EQ(stored->status, TaskStatus::Pending);
  EXPECT_EQ(stored->deadline, clock->now() + 5s);
  EXPECT_EQ(queueLength(), 1u);

  EXPECT_OUTCOME_TRUE(budget,
                      cache->get(cache::keys::syntheticRemaining(kChat)));
  EXPECT_EQ(budget, std::optional<std::string>{"4"});
  EXPECT_EQ(waiter->pending(), 0u);
}

TEST_F(IntakeGatewayTest, Unauthorized) {
  auto req = request();
  req.api_key = "unknown";
  EXPECT_EC(gateway->submit(req), GatewayError::UNAUTHORIZED);
  req.api_key.clear();
  EXPECT_EC(gateway->submit(req), GatewayError::UNAUTHORIZED);
  EXPECT_EQ(queueLength(), 0u);
}

/**
 * @given requests of unknown or disabled task types, with no payload or with
 * a timeout out of range
 * @when submitted
 * @then each is rejected and nothing is queued
 */
TEST_F(IntakeGatewayTest, Rejected) {
  auto unknown = request();
  unknown.task_type = "unknown";
  EXPECT_EC(gateway->submit(unknown), GatewayError::REJECTED);

  auto disabled = request();
  disabled.task_type = "disabled";
  EXPECT_EC(gateway->submit(disabled), GatewayError::REJECTED);

  auto empty = request();
  empty.payload.clear();
  EXPECT_EC(gateway->submit(empty), GatewayError::REJECTED);

  // Rejected requests count against the rate limit too
  clock->advance(1min);
  auto too_short = request();
  too_short.timeout = 1ms;
  EXPECT_EC(gateway->submit(too_short), GatewayError::REJECTED);

  auto too_long = request();
  too_long.timeout = 2min;
  EXPECT_EC(gateway->submit(too_long), GatewayError::REJECTED);

  EXPECT_EQ(queueLength(), 0u);
  EXPECT_OUTCOME_TRUE(stored, tasks->getNonTerminal());
  EXPECT_TRUE(stored.empty());
}

/**
 * @given a queue at capacity
 * @when one more task is submitted
 * @then the caller is told the system is overloaded
 */
TEST_F(IntakeGatewayTest, Overloaded) {
  EXPECT_OUTCOME_TRUE_1(gateway->submit(request()));
  EXPECT_OUTCOME_TRUE_1(gateway->submit(request()));
  EXPECT_EC(gateway->submit(request(true)), GatewayError::OVERLOADED);
  EXPECT_EQ(queueLength(), 2u);
  EXPECT_EQ(waiter->pending(), 0u);
}

/**
 * @given a limit of three requests per minute
 * @when a fourth request arrives within the minute
 * @then it is refused until the next minute
 */
TEST_F(IntakeGatewayTest, RateLimited) {
  auto req = request();
  req.task_type = "unknown";
  for (auto i = 0; i < 3; ++i) {
    EXPECT_EC(gateway->submit(req), GatewayError::REJECTED);
  }
  EXPECT_EC(gateway->submit(request()), GatewayError::RATE_LIMITED);

  clock->advance(1min);
  EXPECT_OUTCOME_TRUE_1(gateway->submit(request()));
}

/**
 * @given a caller waiting for the result
 * @when a router completes the task
 * @then the caller gets the final result
 */
TEST_F(IntakeGatewayTest, WaitsForResult) {
  std::thread router([this] {
    auto entry = queue->next(5s);
    if (entry.has_value() and entry.value()) {
      TaskResult result{
          .task_id = entry.value()->task_id,
          .status = TaskStatus::Completed,
          .participant = "a",
          .latency = 120ms,
          .quality = 0.97,
          .response = R"({"text":"hello"})",
      };
      EXPECT_OUTCOME_TRUE_1(cache->publish(cache::keys::kTaskResultsChannel,
                                           dispatch::encodeTaskResult(result)));
    }
  });

  auto response = gateway->submit(request(true));
  router.join();

  ASSERT_TRUE(response.has_value()) << response.error().message();
  ASSERT_TRUE(response.value().result.has_value());
  auto &result = *response.value().result;
  EXPECT_EQ(result.task_id, response.value().task_id);
  EXPECT_EQ(result.status, TaskStatus::Completed);
  EXPECT_EQ(result.response, R"({"text":"hello"})");
  EXPECT_EQ(waiter->pending(), 0u);
}

/**
 * @given a caller waiting for the result
 * @when nobody answers before the deadline
 * @then the caller gets a timeout, distinct from rejection or overload
 */
TEST_F(IntakeGatewayTest, Timeout) {
  auto req = request(true);
  req.timeout = 50ms;
  EXPECT_EC(gateway->submit(req), GatewayError::TIMEOUT);
  EXPECT_EQ(waiter->pending(), 0u);
  EXPECT_EQ(queueLength(), 1u);
}

/**
 * @given waiters for two tasks
 * @when results of an unknown task and a malformed message arrive
 * @then they are ignored and the waiters keep waiting
 */
TEST(ResultWaiterTest, IgnoresForeignResults) {
  testutil::prepareLoggers();
  auto cache = std::make_shared<cache::InMemoryCache>(
      std::make_shared<clock::ManualSteadyClock>());
  gateway::ResultWaiter waiter{cache};
  EXPECT_OUTCOME_TRUE_1(waiter.subscribe());

  auto first = waiter.expect("t1");
  auto second = waiter.expect("t2");
  EXPECT_EQ(waiter.pending(), 2u);

  waiter.onMessage("garbage");
  EXPECT_OUTCOME_TRUE_1(cache->publish(
      cache::keys::kTaskResultsChannel,
      dispatch::encodeTaskResult({.task_id = "other",
                                  .status = TaskStatus::Failed})));
  EXPECT_EQ(waiter.pending(), 2u);

  EXPECT_OUTCOME_TRUE_1(cache->publish(
      cache::keys::kTaskResultsChannel,
      dispatch::encodeTaskResult({.task_id = "t2",
                                  .status = TaskStatus::Expired})));
  ASSERT_EQ(second.wait_for(0ms), std::future_status::ready);
  EXPECT_EQ(second.get().status, TaskStatus::Expired);
  EXPECT_NE(first.wait_for(0ms), std::future_status::ready);

  waiter.cancel("t1");
  EXPECT_EQ(waiter.pending(), 0u);
}
