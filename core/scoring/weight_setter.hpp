/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "chain/chain_client.hpp"
#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "storage/participant_repository.hpp"
#include "storage/score_repository.hpp"
#include "storage/weight_submission_repository.hpp"
#include "utils/backoff.hpp"
#include "utils/stop_signal.hpp"

namespace nineteen::scoring {

  struct WeightSetterConfig {
    BackoffPolicy backoff{.base = std::chrono::seconds(1),
                          .max = std::chrono::seconds(30)};

    /// Chain write attempts per epoch
    uint32_t max_attempts{5};
  };

  /**
   * Scores of eligible participants normalised to sum 1. Participants
   * without a score count as zero; if all are zero the weights are uniform.
   * @return entries ordered by node id, empty if nobody is eligible
   */
  std::vector<primitives::WeightEntry> normalizeWeights(
      const std::vector<primitives::Participant> &participants,
      const std::vector<primitives::Score> &scores);

  /**
   * Submits a weight vector once per epoch
   */
  class WeightSetter {
   public:
    WeightSetter(
        WeightSetterConfig config,
        std::shared_ptr<chain::ChainClient> chain_client,
        std::shared_ptr<storage::ParticipantRepository> participants,
        std::shared_ptr<storage::ScoreRepository> scores,
        std::shared_ptr<storage::WeightSubmissionRepository> submissions,
        std::shared_ptr<clock::SystemClock> clock);

    /**
     * Succeeds at once if the epoch already has a submitted vector. A failed
     * chain write is retried with backoff; after the last attempt the epoch
     * is stored as failed.
     * @return ScoringError::SUBMISSION_FAILED after exhausting attempts
     */
    outcome::result<void> submitWeights(primitives::Epoch epoch);

    /// Interrupts pending retries
    void stop();

   private:
    outcome::result<void> storeFailure(primitives::WeightSubmission submission);

    WeightSetterConfig config_;
    std::shared_ptr<chain::ChainClient> chain_client_;
    std::shared_ptr<storage::ParticipantRepository> participants_;
    std::shared_ptr<storage::ScoreRepository> scores_;
    std::shared_ptr<storage::WeightSubmissionRepository> submissions_;
    std::shared_ptr<clock::SystemClock> clock_;
    StopSignal stop_signal_;
    log::Logger logger_;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();
    metrics::Counter *metric_submitted_;
    metrics::Counter *metric_failed_;
  };

}  // namespace nineteen::scoring
