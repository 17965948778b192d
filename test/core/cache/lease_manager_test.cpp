/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cache/lease_manager.hpp"

#include <gtest/gtest.h>

#include "cache/in_memory/in_memory_cache.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using nineteen::cache::InMemoryCache;
using nineteen::cache::LeaseManager;
using nineteen::clock::ManualSteadyClock;

class LeaseManagerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  std::shared_ptr<ManualSteadyClock> clock =
      std::make_shared<ManualSteadyClock>();
  std::shared_ptr<InMemoryCache> cache = std::make_shared<InMemoryCache>(clock);

  // two processes sharing one cache
  LeaseManager first{cache};
  LeaseManager second{cache};
};

TEST_F(LeaseManagerTest, OwnerTokensDiffer) {
  EXPECT_FALSE(first.ownerToken().empty());
  EXPECT_NE(first.ownerToken(), second.ownerToken());
}

/**
 * @given lease taken by the first process
 * @when the second one tries to take, extend or release it
 * @then every attempt fails and the lease stays with the first
 */
TEST_F(LeaseManagerTest, Exclusive) {
  EXPECT_OUTCOME_TRUE(acquired, first.acquire("task_lease:1", 1s));
  EXPECT_TRUE(acquired);

  EXPECT_OUTCOME_TRUE(stolen, second.acquire("task_lease:1", 1s));
  EXPECT_FALSE(stolen);
  EXPECT_OUTCOME_TRUE(extended, second.extend("task_lease:1", 1s));
  EXPECT_FALSE(extended);
  EXPECT_OUTCOME_TRUE(released, second.release("task_lease:1"));
  EXPECT_FALSE(released);

  EXPECT_OUTCOME_TRUE(held, first.isHeld("task_lease:1"));
  EXPECT_TRUE(held);
  EXPECT_OUTCOME_TRUE(own_release, first.release("task_lease:1"));
  EXPECT_TRUE(own_release);
  EXPECT_OUTCOME_TRUE(held_after, second.isHeld("task_lease:1"));
  EXPECT_FALSE(held_after);
}

/**
 * @given lease of a crashed owner
 * @when its ttl elapses
 * @then another process can take it
 */
TEST_F(LeaseManagerTest, LapsedLeaseIsTakenOver) {
  EXPECT_OUTCOME_TRUE_1(first.acquire("task_lease:2", 500ms));
  clock->advance(500ms);
  EXPECT_OUTCOME_TRUE(acquired, second.acquire("task_lease:2", 500ms));
  EXPECT_TRUE(acquired);
  EXPECT_OUTCOME_TRUE(extended, first.extend("task_lease:2", 500ms));
  EXPECT_FALSE(extended);
}
