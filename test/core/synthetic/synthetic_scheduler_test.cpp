/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "synthetic/synthetic_scheduler.hpp"

#include <gtest/gtest.h>

#include <thread>

#include "cache/cache_keys.hpp"
#include "cache/in_memory/in_memory_cache.hpp"
#include "dispatch/messages.hpp"
#include "mock/core/application/app_state_manager_mock.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "storage/in_memory/in_memory_repositories.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using namespace nineteen;  // NOLINT
using primitives::Participant;
using primitives::Task;
using primitives::TaskKind;
using primitives::TaskStatus;
using primitives::TaskType;
using synthetic::plannedRequests;
using testing::NiceMock;

namespace {
  const std::string kChat = "chat-llama-3-2-3b";
  const std::string kImage = "proteus-text-to-image";

  TaskType taskType(std::string name, double capacity, double volume = 1.) {
    return TaskType{
        .name = std::move(name),
        .volume_to_requests = volume,
        .capacity_per_participant = capacity,
        .timeout = 20s,
    };
  }
}  // namespace

TEST(PlannedRequestsTest, ScalesWithEligibleCapacity) {
  EXPECT_EQ(plannedRequests(taskType(kChat, 10., 2.), 3, 1.), 15);
  EXPECT_EQ(plannedRequests(taskType(kChat, 10., 2.), 3, 0.5), 7);
  EXPECT_EQ(plannedRequests(taskType(kChat, 10., 2.), 0, 1.), 0);

  auto disabled = taskType(kChat, 10.);
  disabled.enabled = false;
  EXPECT_EQ(plannedRequests(disabled, 3, 1.), 0);
  EXPECT_EQ(plannedRequests(taskType(kChat, 10., 0.), 3, 1.), 0);
}

class SyntheticSchedulerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    std::vector<Participant> list;
    for (auto hotkey : {"a", "b", "c"}) {
      Participant p;
      p.hotkey = hotkey;
      p.eligible = hotkey != std::string{"c"};
      list.emplace_back(std::move(p));
    }
    EXPECT_OUTCOME_TRUE_1(participants->replaceAll(list, clock->now()));
  }

  int64_t budget(const std::string &task_type) {
    auto res = cache->get(cache::keys::syntheticRemaining(task_type));
    EXPECT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().has_value());
    return std::stoll(res.value().value_or("-1"));
  }

  std::vector<Task> queued() {
    std::vector<Task> result;
    auto entries = cache->listRange(cache::keys::kQueryQueue);
    EXPECT_TRUE(entries.has_value());
    for (auto &message : entries.value()) {
      auto entry = dispatch::decodeQueueEntry(message);
      EXPECT_TRUE(entry.has_value());
      auto task = tasks->get(entry.value().task_id);
      EXPECT_TRUE(task.has_value());
      if (task.value()) {
        result.emplace_back(*task.value());
      }
    }
    return result;
  }

  NiceMock<application::AppStateManagerMock> app_state_manager;
  std::shared_ptr<clock::ManualClock> clock =
      std::make_shared<clock::ManualClock>();
  std::shared_ptr<cache::InMemoryCache> cache =
      std::make_shared<cache::InMemoryCache>(
          std::make_shared<clock::ManualSteadyClock>());
  std::shared_ptr<storage::InMemoryTaskRepository> tasks =
      std::make_shared<storage::InMemoryTaskRepository>();
  std::shared_ptr<storage::InMemoryParticipantRepository> participants =
      std::make_shared<storage::InMemoryParticipantRepository>();
  std::shared_ptr<dispatch::TaskQueue> queue =
      std::make_shared<dispatch::TaskQueue>(
          dispatch::QueueConfig{}, tasks, cache, clock);

  // Two eligible participants give 10 chat requests and no image requests
  synthetic::SyntheticScheduler scheduler{
      app_state_manager,
      synthetic::SyntheticConfig{.scoring_period = 1h},
      {taskType(kChat, 5.), taskType(kImage, 0.)},
      queue,
      participants,
      cache,
      clock,
      42};
};

/**
 * @given two eligible participants and a stale synthetic entry in the queue
 * @when a period begins
 * @then the stale entry is expired, the budget is published and the requests
 * are spread evenly over the period
 */
TEST_F(SyntheticSchedulerTest, BeginPeriod) {
  Task stale{
      .id = "stale",
      .kind = TaskKind::Synthetic,
      .task_type = kChat,
      .payload = "{}",
      .deadline = clock->now() + 1min,
  };
  EXPECT_OUTCOME_TRUE_1(queue->enqueue(stale));
  Task organic = stale;
  organic.id = "organic";
  organic.kind = TaskKind::Organic;
  EXPECT_OUTCOME_TRUE_1(queue->enqueue(organic));

  EXPECT_OUTCOME_TRUE(planned, scheduler.beginPeriod());
  EXPECT_EQ(planned, 1u);

  ASSERT_EQ(scheduler.schedules().size(), 1u);
  auto &schedule = scheduler.schedules().front();
  EXPECT_EQ(schedule.task_type, kChat);
  EXPECT_EQ(schedule.total_requests, 10);
  EXPECT_EQ(schedule.remaining, 10);
  EXPECT_EQ(schedule.interval, std::chrono::milliseconds{3600000 / 11});
  EXPECT_GE(schedule.next_at, clock->now());
  EXPECT_LT(schedule.next_at, clock->now() + schedule.interval);
  EXPECT_EQ(budget(kChat), 10);

  auto left = queued();
  ASSERT_EQ(left.size(), 1u);
  EXPECT_EQ(left[0].id, "organic");
  EXPECT_OUTCOME_TRUE(stored, tasks->get("stale"));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, TaskStatus::Expired);
  EXPECT_FALSE(scheduler.done());
}

/**
 * @given a planned period
 * @when slots come due
 * @then one synthetic task is queued per slot and the shared budget shrinks
 */
TEST_F(SyntheticSchedulerTest, TickEnqueuesDueSlots) {
  EXPECT_OUTCOME_TRUE_1(scheduler.beginPeriod());
  auto interval = scheduler.schedules().front().interval;

  // The first slot may be due at once
  EXPECT_OUTCOME_TRUE(immediate, scheduler.tick());
  if (immediate == 0) {
    clock->advance(interval);
    EXPECT_OUTCOME_TRUE(first, scheduler.tick());
    EXPECT_EQ(first, 1u);
  }
  EXPECT_EQ(budget(kChat), 9);

  auto synthetic = queued();
  ASSERT_EQ(synthetic.size(), 1u);
  EXPECT_EQ(synthetic[0].kind, TaskKind::Synthetic);
  EXPECT_EQ(synthetic[0].task_type, kChat);
  EXPECT_EQ(synthetic[0].status, TaskStatus::Pending);
  EXPECT_EQ(synthetic[0].deadline, clock->now() + 20s);
  EXPECT_NE(synthetic[0].payload.find(R"("synthetic":true)"),
            std::string::npos);

  // Next slot is one interval later
  EXPECT_OUTCOME_TRUE(early, scheduler.tick());
  EXPECT_EQ(early, 0u);
  ASSERT_TRUE(scheduler.nextAt().has_value());
  EXPECT_EQ(*scheduler.nextAt(), clock->now() + interval);
  clock->advance(interval);
  EXPECT_OUTCOME_TRUE(second, scheduler.tick());
  EXPECT_EQ(second, 1u);
  EXPECT_EQ(budget(kChat), 8);
  EXPECT_EQ(scheduler.schedules().front().remaining, 8);
}

/**
 * @given organic requests that used up part of the budget
 * @when the next slot comes due
 * @then the scheduler skips as many slots as organic requests were served
 */
TEST_F(SyntheticSchedulerTest, OrganicTrafficIsSkipped) {
  EXPECT_OUTCOME_TRUE_1(scheduler.beginPeriod());
  auto interval = scheduler.schedules().front().interval;
  auto next_at = scheduler.schedules().front().next_at;
  EXPECT_OUTCOME_TRUE_1(cache->incrementBy(
      cache::keys::syntheticRemaining(kChat), -3, std::nullopt));

  clock->set(next_at);
  EXPECT_OUTCOME_TRUE(enqueued, scheduler.tick());
  EXPECT_EQ(enqueued, 0u);
  EXPECT_TRUE(queued().empty());

  ASSERT_EQ(scheduler.schedules().size(), 1u);
  EXPECT_EQ(scheduler.schedules().front().remaining, 7);
  EXPECT_EQ(scheduler.schedules().front().next_at, next_at + interval * 3);
  EXPECT_EQ(budget(kChat), 7);
}

/**
 * @given a budget spent entirely by organic traffic
 * @when the next slot comes due
 * @then the schedule is dropped and the period is done
 */
TEST_F(SyntheticSchedulerTest, SpentBudgetEndsSchedule) {
  EXPECT_OUTCOME_TRUE_1(scheduler.beginPeriod());
  EXPECT_OUTCOME_TRUE_1(cache->set(
      cache::keys::syntheticRemaining(kChat), "0", std::nullopt));

  clock->set(scheduler.schedules().front().next_at);
  EXPECT_OUTCOME_TRUE(enqueued, scheduler.tick());
  EXPECT_EQ(enqueued, 0u);
  EXPECT_TRUE(scheduler.schedules().empty());
  EXPECT_TRUE(scheduler.done());
}

/**
 * @given a planned period
 * @when the period is over
 * @then nothing more is queued
 */
TEST_F(SyntheticSchedulerTest, NothingAfterPeriodEnd) {
  EXPECT_OUTCOME_TRUE_1(scheduler.beginPeriod());
  clock->advance(scheduler.periodLength());
  EXPECT_TRUE(scheduler.done());
  EXPECT_OUTCOME_TRUE(enqueued, scheduler.tick());
  EXPECT_EQ(enqueued, 0u);
  EXPECT_TRUE(queued().empty());
}

/**
 * @given nobody eligible
 * @when a period begins
 * @then nothing is planned
 */
TEST_F(SyntheticSchedulerTest, NobodyEligible) {
  EXPECT_OUTCOME_TRUE_1(participants->replaceAll({}, clock->now()));
  EXPECT_OUTCOME_TRUE(planned, scheduler.beginPeriod());
  EXPECT_EQ(planned, 0u);
  EXPECT_TRUE(scheduler.done());
}

TEST_F(SyntheticSchedulerTest, PeriodLengthFollowsMultiplier) {
  synthetic::SyntheticScheduler shortened{
      app_state_manager,
      synthetic::SyntheticConfig{.scoring_period = 1h,
                                 .scoring_period_multiplier = 0.25},
      {taskType(kChat, 5.)},
      queue,
      participants,
      cache,
      clock,
      1};
  EXPECT_EQ(shortened.periodLength(), 15min);
  EXPECT_OUTCOME_TRUE_1(shortened.beginPeriod());
  ASSERT_EQ(shortened.schedules().size(), 1u);
  EXPECT_EQ(shortened.schedules().front().total_requests, 2);
}

/**
 * @given a started scheduler
 * @when it is stopped while waiting for the next slot
 * @then the planned period stays as it was and nothing more is queued
 */
TEST_F(SyntheticSchedulerTest, StartThenStop) {
  ASSERT_TRUE(scheduler.start());
  auto key = cache::keys::syntheticRemaining(kChat);
  for (auto i = 0; i < 200; ++i) {
    EXPECT_OUTCOME_TRUE(value, cache->get(key));
    if (value) {
      break;
    }
    std::this_thread::sleep_for(10ms);
  }
  std::this_thread::sleep_for(50ms);
  scheduler.stop();

  auto left = budget(kChat);
  EXPECT_GE(left, 9);
  EXPECT_EQ(queued().size(), static_cast<size_t>(10 - left));

  clock->advance(10min);
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(budget(kChat), left);
  EXPECT_EQ(queued().size(), static_cast<size_t>(10 - left));
}
