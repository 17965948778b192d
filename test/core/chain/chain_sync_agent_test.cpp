/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/chain_sync_agent.hpp"

#include <gtest/gtest.h>

#include "cache/cache_keys.hpp"
#include "cache/in_memory/in_memory_cache.hpp"
#include "chain/chain_error.hpp"
#include "mock/core/application/app_state_manager_mock.hpp"
#include "mock/core/chain/chain_client_mock.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "mock/core/clock/ticker_mock.hpp"
#include "storage/in_memory/in_memory_repositories.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using namespace nineteen;  // NOLINT
using chain::ChainError;
using chain::SyncError;
using primitives::Participant;
using testing::_;
using testing::NiceMock;
using testing::Return;

namespace {
  Participant worker(std::string hotkey, primitives::NodeId node_id) {
    return Participant{.hotkey = std::move(hotkey),
                       .node_id = node_id,
                       .stake = 10.,
                       .ip = "10.0.0.1",
                       .port = 8091};
  }
}  // namespace

class ChainSyncAgentTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    agent = std::make_shared<chain::ChainSyncAgent>(app_state_manager,
                                                    chain::SyncConfig{},
                                                    chain_client,
                                                    participants,
                                                    cache,
                                                    leases,
                                                    clock,
                                                    ticker);
    EXPECT_OUTCOME_TRUE_1(cache->subscribe(
        cache::keys::kEligibilityChangedChannel,
        [this](const std::string &) { ++eligibility_changes; }));
  }

  std::vector<Participant> current() {
    auto res = participants->getAll();
    EXPECT_TRUE(res.has_value());
    return res.has_value() ? res.value() : std::vector<Participant>{};
  }

  NiceMock<application::AppStateManagerMock> app_state_manager;
  std::shared_ptr<chain::ChainClientMock> chain_client =
      std::make_shared<chain::ChainClientMock>();
  std::shared_ptr<storage::InMemoryParticipantRepository> participants =
      std::make_shared<storage::InMemoryParticipantRepository>();
  std::shared_ptr<clock::ManualSteadyClock> steady_clock =
      std::make_shared<clock::ManualSteadyClock>();
  std::shared_ptr<cache::InMemoryCache> cache =
      std::make_shared<cache::InMemoryCache>(steady_clock);
  std::shared_ptr<cache::LeaseManager> leases =
      std::make_shared<cache::LeaseManager>(cache);
  std::shared_ptr<clock::ManualClock> clock =
      std::make_shared<clock::ManualClock>();
  std::shared_ptr<NiceMock<clock::TickerMock>> ticker =
      std::make_shared<NiceMock<clock::TickerMock>>();
  std::shared_ptr<chain::ChainSyncAgent> agent;
  int eligibility_changes = 0;
};

TEST(ChainEligibilityTest, IsEligible) {
  auto p = worker("a", 0);
  EXPECT_TRUE(chain::isEligible(p, 1000.));
  p.stake = 1000.5;
  EXPECT_FALSE(chain::isEligible(p, 1000.));
  p = worker("a", 0);
  p.ip = "0.0.0.0";
  EXPECT_FALSE(chain::isEligible(p, 1000.));
  p = worker("a", 0);
  p.port = 0;
  EXPECT_FALSE(chain::isEligible(p, 1000.));
}

/**
 * @given chain with an eligible worker and a validator sized stake
 * @when sync
 * @then table holds both with eligibility and timestamp filled in and the
 * change is announced
 */
TEST_F(ChainSyncAgentTest, SyncReplacesSnapshot) {
  auto validator = worker("v", 1);
  validator.stake = 50'000.;
  EXPECT_CALL(*chain_client, fetchParticipants())
      .WillOnce(Return(std::vector<Participant>{worker("a", 0), validator}));

  EXPECT_OUTCOME_TRUE_1(agent->sync());

  auto stored = current();
  ASSERT_EQ(stored.size(), 2u);
  EXPECT_TRUE(stored[0].eligible);
  EXPECT_FALSE(stored[1].eligible);
  EXPECT_EQ(stored[0].last_updated, clock->now());
  EXPECT_EQ(eligibility_changes, 1);
}

/**
 * @given synced participant table
 * @when the chain fails in the middle of the next sync
 * @then the previous snapshot stays and the pass after it succeeds
 */
TEST_F(ChainSyncAgentTest, FailedSyncKeepsSnapshot) {
  EXPECT_CALL(*chain_client, fetchParticipants())
      .WillOnce(Return(std::vector<Participant>{worker("a", 0)}))
      .WillOnce(Return(outcome::failure(ChainError::RPC_ERROR)))
      .WillOnce(
          Return(std::vector<Participant>{worker("a", 0), worker("b", 1)}));

  EXPECT_OUTCOME_TRUE_1(agent->sync());
  auto before = current();

  clock->advance(5min);
  EXPECT_EC(agent->sync(), ChainError::RPC_ERROR);
  EXPECT_EQ(current(), before);

  clock->advance(5min);
  EXPECT_OUTCOME_TRUE_1(agent->sync());
  EXPECT_EQ(current().size(), 2u);
  EXPECT_EQ(eligibility_changes, 2);
}

/**
 * @given sync token held by another agent
 * @when sync
 * @then the pass is skipped without touching the chain
 */
TEST_F(ChainSyncAgentTest, ConcurrentSyncIsSkipped) {
  cache::LeaseManager other{cache};
  EXPECT_OUTCOME_TRUE_1(other.acquire(cache::keys::kChainSyncLock, 1min));
  EXPECT_CALL(*chain_client, fetchParticipants()).Times(0);

  EXPECT_EC(agent->sync(), SyncError::SYNC_IN_PROGRESS);
}

/**
 * @given synced participant table
 * @when sync again with the same eligible set
 * @then no eligibility change is announced
 */
TEST_F(ChainSyncAgentTest, UnchangedEligibilityIsQuiet) {
  EXPECT_CALL(*chain_client, fetchParticipants())
      .WillRepeatedly(Return(std::vector<Participant>{worker("a", 0)}));
  EXPECT_OUTCOME_TRUE_1(agent->sync());
  EXPECT_OUTCOME_TRUE_1(agent->sync());
  EXPECT_EQ(eligibility_changes, 1);
}

/**
 * @given agent controlled by the app state manager
 * @when it starts
 * @then the first pass is scheduled immediately
 */
TEST_F(ChainSyncAgentTest, StartSchedulesImmediatePass) {
  std::function<void(const std::error_code &)> tick;
  EXPECT_CALL(*ticker, onTick(_))
      .WillOnce(testing::SaveArg<0>(&tick));
  EXPECT_CALL(*ticker, start(clock::SteadyClock::Duration::zero()));
  EXPECT_TRUE(agent->start());

  EXPECT_CALL(*chain_client, fetchParticipants())
      .WillOnce(Return(std::vector<Participant>{worker("a", 0)}));
  ASSERT_TRUE(tick);
  tick({});
  EXPECT_EQ(current().size(), 1u);
}
