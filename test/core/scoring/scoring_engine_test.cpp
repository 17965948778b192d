/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scoring/scoring_engine.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "mock/core/clock/clock_mock.hpp"
#include "storage/in_memory/in_memory_repositories.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using namespace nineteen;  // NOLINT
using primitives::TaskOutcome;
using scoring::aggregateScores;
using scoring::ScoringConfig;

namespace {
  TaskOutcome outcomeOf(std::string task_id,
                        std::string hotkey,
                        bool success,
                        double quality,
                        primitives::Timestamp timestamp) {
    return TaskOutcome{.task_id = std::move(task_id),
                       .hotkey = std::move(hotkey),
                       .latency = 200ms,
                       .success = success,
                       .quality = quality,
                       .timestamp = timestamp};
  }
}  // namespace

class ScoringEngineTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    EXPECT_OUTCOME_TRUE_1(participants->replaceAll(
        {{.hotkey = "a", .node_id = 0}, {.hotkey = "b", .node_id = 1}},
        clock->now()));
  }

  std::shared_ptr<clock::ManualClock> clock =
      std::make_shared<clock::ManualClock>();
  std::shared_ptr<storage::InMemoryOutcomeRepository> outcomes =
      std::make_shared<storage::InMemoryOutcomeRepository>();
  std::shared_ptr<storage::InMemoryParticipantRepository> participants =
      std::make_shared<storage::InMemoryParticipantRepository>();
  std::shared_ptr<storage::InMemoryScoreRepository> scores =
      std::make_shared<storage::InMemoryScoreRepository>();
  scoring::ScoringEngine engine{
      ScoringConfig{}, outcomes, participants, scores, clock};
};

/**
 * @given participant without outcomes
 * @when aggregate scores
 * @then it gets the baseline
 */
TEST(AggregateScoresTest, Baseline) {
  auto now = clock::fromMillis(1'000'000);
  auto result = aggregateScores({}, {"a"}, now, ScoringConfig{});
  ASSERT_EQ(result.size(), 1u);
  EXPECT_DOUBLE_EQ(result[0].value, 0.5);
  EXPECT_EQ(result[0].samples, 0u);
  EXPECT_EQ(result[0].computed_at, now);
}

/**
 * @given fresh outcomes and ones one half-life old
 * @when aggregate scores
 * @then old outcomes count half and failures count as zero quality
 */
TEST(AggregateScoresTest, DecayAndPrior) {
  ScoringConfig config{.half_life = 1h, .prior_weight = 1., .baseline = 0.};
  auto now = clock::fromMillis(10 * 3'600'000);
  auto result = aggregateScores({outcomeOf("t1", "a", true, 1., now),
                                 outcomeOf("t2", "a", true, 1., now - 1h),
                                 outcomeOf("t3", "b", false, 1., now)},
                                {"a", "b"},
                                now,
                                config);
  ASSERT_EQ(result.size(), 2u);
  // (1 + 0.5) / (1 + 0.5 + 1)
  EXPECT_DOUBLE_EQ(result[0].value, 1.5 / 2.5);
  EXPECT_EQ(result[0].samples, 2u);
  EXPECT_DOUBLE_EQ(result[1].value, 0.);
}

/**
 * @given set of outcomes
 * @when aggregate it in many different orders
 * @then every order gives exactly the same scores
 */
TEST(AggregateScoresTest, OrderIndependent) {
  auto now = clock::fromMillis(50'000'000);
  std::vector<TaskOutcome> outcomes;
  for (int i = 0; i < 40; ++i) {
    outcomes.push_back(outcomeOf("t" + std::to_string(i),
                                 i % 3 == 0 ? "a" : "b",
                                 i % 5 != 0,
                                 0.1 + 0.02 * i,
                                 now - std::chrono::minutes(17 * i)));
  }
  auto expected = aggregateScores(outcomes, {"a", "b"}, now, ScoringConfig{});

  std::mt19937 rng(19);
  for (int round = 0; round < 20; ++round) {
    std::shuffle(outcomes.begin(), outcomes.end(), rng);
    auto result = aggregateScores(outcomes, {"a", "b"}, now, ScoringConfig{});
    ASSERT_EQ(result.size(), expected.size());
    for (size_t i = 0; i < result.size(); ++i) {
      EXPECT_EQ(result[i].value, expected[i].value);
    }
  }
}

/**
 * @given recorded outcome
 * @when record it again
 * @then it succeeds and the score is computed from one record
 */
TEST_F(ScoringEngineTest, RecordOutcomeIsIdempotent) {
  auto outcome = outcomeOf("t1", "a", true, 1., clock->now());
  EXPECT_OUTCOME_TRUE_1(engine.recordOutcome(outcome));
  EXPECT_OUTCOME_TRUE_1(engine.recordOutcome(outcome));

  EXPECT_OUTCOME_TRUE(recorded, engine.outcomesOf("t1"));
  EXPECT_EQ(recorded.size(), 1u);

  EXPECT_OUTCOME_TRUE(computed, engine.computeScores());
  ASSERT_EQ(computed.size(), 2u);
  EXPECT_EQ(computed[0].hotkey, "a");
  EXPECT_EQ(computed[0].samples, 1u);
}

/**
 * @given outcomes inside and outside of the window
 * @when compute scores
 * @then only the recent ones count and scores are stored
 */
TEST_F(ScoringEngineTest, ComputeScoresOverWindow) {
  EXPECT_OUTCOME_TRUE_1(engine.recordOutcome(
      outcomeOf("old", "b", false, 0., clock->now() - 25h)));
  EXPECT_OUTCOME_TRUE_1(
      engine.recordOutcome(outcomeOf("new", "b", true, 1., clock->now())));

  EXPECT_OUTCOME_TRUE(computed, engine.computeScores(24h));
  ASSERT_EQ(computed.size(), 2u);
  EXPECT_EQ(computed[1].hotkey, "b");
  EXPECT_EQ(computed[1].samples, 1u);
  // (1 + 2 * 0.5) / (1 + 2)
  EXPECT_DOUBLE_EQ(computed[1].value, 2. / 3.);

  EXPECT_OUTCOME_TRUE(stored, scores->getAll());
  EXPECT_EQ(stored, computed);
}
