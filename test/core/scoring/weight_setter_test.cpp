/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scoring/weight_setter.hpp"

#include <gtest/gtest.h>

#include "chain/chain_error.hpp"
#include "mock/core/chain/chain_client_mock.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "scoring/scoring_error.hpp"
#include "storage/in_memory/in_memory_repositories.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using namespace nineteen;  // NOLINT
using chain::ChainError;
using primitives::Participant;
using primitives::Score;
using primitives::SubmissionStatus;
using scoring::normalizeWeights;
using scoring::ScoringError;
using testing::_;
using testing::Return;

namespace {
  Participant participant(std::string hotkey,
                          primitives::NodeId node_id,
                          bool eligible = true) {
    return Participant{
        .hotkey = std::move(hotkey), .node_id = node_id, .eligible = eligible};
  }
}  // namespace

TEST(NormalizeWeightsTest, ProportionalToScores) {
  auto weights = normalizeWeights(
      {participant("b", 4), participant("a", 2), participant("x", 1, false)},
      {Score{.hotkey = "a", .value = 0.3},
       Score{.hotkey = "b", .value = 0.1},
       Score{.hotkey = "x", .value = 0.9}});
  ASSERT_EQ(weights.size(), 2u);
  EXPECT_EQ(weights[0].node_id, 2);
  EXPECT_DOUBLE_EQ(weights[0].weight, 0.75);
  EXPECT_EQ(weights[1].hotkey, "b");
  EXPECT_DOUBLE_EQ(weights[1].weight, 0.25);
}

/**
 * @given eligible participants without scores
 * @when normalize weights
 * @then weights are uniform
 */
TEST(NormalizeWeightsTest, UniformWhenAllZero) {
  auto weights =
      normalizeWeights({participant("a", 0), participant("b", 1)}, {});
  ASSERT_EQ(weights.size(), 2u);
  EXPECT_DOUBLE_EQ(weights[0].weight, 0.5);
  EXPECT_DOUBLE_EQ(weights[1].weight, 0.5);
  EXPECT_TRUE(normalizeWeights({participant("c", 2, false)}, {}).empty());
}

class WeightSetterTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    EXPECT_OUTCOME_TRUE_1(participants->replaceAll(
        {participant("a", 0), participant("b", 1)}, clock->now()));
    EXPECT_OUTCOME_TRUE_1(scores->replaceAll(
        {Score{.hotkey = "a", .value = 0.6},
         Score{.hotkey = "b", .value = 0.2}}));
  }

  std::shared_ptr<chain::ChainClientMock> chain_client =
      std::make_shared<chain::ChainClientMock>();
  std::shared_ptr<storage::InMemoryParticipantRepository> participants =
      std::make_shared<storage::InMemoryParticipantRepository>();
  std::shared_ptr<storage::InMemoryScoreRepository> scores =
      std::make_shared<storage::InMemoryScoreRepository>();
  std::shared_ptr<storage::InMemoryWeightSubmissionRepository> submissions =
      std::make_shared<storage::InMemoryWeightSubmissionRepository>();
  std::shared_ptr<clock::ManualClock> clock =
      std::make_shared<clock::ManualClock>();
  scoring::WeightSetter setter{
      scoring::WeightSetterConfig{.backoff = {.base = 1ms, .max = 2ms},
                                  .max_attempts = 3},
      chain_client,
      participants,
      scores,
      submissions,
      clock};
};

/**
 * @given epoch without submission
 * @when submit weights for it twice
 * @then the chain is written once and the epoch has a single row
 */
TEST_F(WeightSetterTest, SubmitOncePerEpoch) {
  EXPECT_CALL(*chain_client, submitWeights(5, _))
      .WillOnce(Return(std::string{"0xabc"}));

  EXPECT_OUTCOME_TRUE_1(setter.submitWeights(5));
  EXPECT_OUTCOME_TRUE_1(setter.submitWeights(5));

  EXPECT_EQ(submissions->size(), 1u);
  EXPECT_OUTCOME_TRUE(stored, submissions->get(5));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, SubmissionStatus::Submitted);
  EXPECT_EQ(stored->tx_ref, "0xabc");
  EXPECT_EQ(stored->attempts, 1u);
  ASSERT_EQ(stored->weights.size(), 2u);
  EXPECT_DOUBLE_EQ(stored->weights[0].weight, 0.75);
}

/**
 * @given chain failing transiently once
 * @when submit weights
 * @then the write is retried and succeeds
 */
TEST_F(WeightSetterTest, RetriesTransientFailure) {
  EXPECT_CALL(*chain_client, submitWeights(6, _))
      .WillOnce(Return(outcome::failure(ChainError::RPC_ERROR)))
      .WillOnce(Return(std::string{"0xdef"}));

  EXPECT_OUTCOME_TRUE_1(setter.submitWeights(6));
  EXPECT_OUTCOME_TRUE(stored, submissions->get(6));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->attempts, 2u);
  EXPECT_EQ(stored->status, SubmissionStatus::Submitted);
}

/**
 * @given chain which keeps failing
 * @when submit weights
 * @then all attempts are spent and the epoch is stored as failed
 */
TEST_F(WeightSetterTest, ExhaustedAttempts) {
  EXPECT_CALL(*chain_client, submitWeights(7, _))
      .Times(3)
      .WillRepeatedly(Return(outcome::failure(ChainError::BAD_RESPONSE)));

  EXPECT_EC(setter.submitWeights(7), ScoringError::SUBMISSION_FAILED);
  EXPECT_OUTCOME_TRUE(stored, submissions->get(7));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, SubmissionStatus::Failed);
  EXPECT_EQ(stored->attempts, 3u);
  EXPECT_FALSE(stored->tx_ref.has_value());
}

/**
 * @given chain refusing the weights
 * @when submit weights
 * @then the refusal is not retried
 */
TEST_F(WeightSetterTest, RejectionIsNotRetried) {
  EXPECT_CALL(*chain_client, submitWeights(8, _))
      .WillOnce(Return(outcome::failure(ChainError::REJECTED)));
  EXPECT_EC(setter.submitWeights(8), ScoringError::SUBMISSION_FAILED);

  // a later pass picks the failed epoch up again
  EXPECT_CALL(*chain_client, submitWeights(8, _))
      .WillOnce(Return(std::string{"0x1"}));
  EXPECT_OUTCOME_TRUE_1(setter.submitWeights(8));
  EXPECT_OUTCOME_TRUE(stored, submissions->get(8));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->attempts, 2u);
  EXPECT_EQ(submissions->size(), 1u);
}

TEST_F(WeightSetterTest, NobodyEligible) {
  EXPECT_OUTCOME_TRUE_1(
      participants->replaceAll({participant("a", 0, false)}, clock->now()));
  EXPECT_CALL(*chain_client, submitWeights(_, _)).Times(0);
  EXPECT_EC(setter.submitWeights(9), ScoringError::NO_ELIGIBLE_PARTICIPANTS);
}
