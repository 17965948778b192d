/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "storage/outcome_repository.hpp"
#include "storage/participant_repository.hpp"
#include "storage/score_repository.hpp"

namespace nineteen::scoring {

  struct ScoringConfig {
    /// Outcomes older than this are not taken into account
    std::chrono::milliseconds window{std::chrono::hours(24)};

    /// Age at which an outcome counts half
    std::chrono::milliseconds half_life{std::chrono::hours(6)};

    /// Weight of the baseline, in outcomes
    double prior_weight{2.};

    /// Score of a participant without outcomes
    double baseline{0.5};
  };

  /**
   * Decay-weighted average quality with a prior:
   * score = (sum w*q + prior_weight*baseline) / (sum w + prior_weight),
   * w = 2^(-age/half_life), q = quality of a successful outcome or 0.
   * Outcomes are summed in (hotkey, task id) order, so the result does not
   * depend on the order of \param outcomes.
   * @return score of each of \param hotkeys, in the same order
   */
  std::vector<primitives::Score> aggregateScores(
      std::vector<primitives::TaskOutcome> outcomes,
      const std::vector<primitives::Hotkey> &hotkeys,
      primitives::Timestamp now,
      const ScoringConfig &config);

  class ScoringEngine {
   public:
    ScoringEngine(ScoringConfig config,
                  std::shared_ptr<storage::OutcomeRepository> outcomes,
                  std::shared_ptr<storage::ParticipantRepository> participants,
                  std::shared_ptr<storage::ScoreRepository> scores,
                  std::shared_ptr<clock::SystemClock> clock);

    /**
     * Stores \param outcome. Replaying an outcome of the same task and
     * participant succeeds without a second record.
     */
    outcome::result<void> recordOutcome(const primitives::TaskOutcome &outcome);

    outcome::result<std::vector<primitives::TaskOutcome>> outcomesOf(
        const primitives::TaskId &task_id) const {
      return outcomes_->getForTask(task_id);
    }

    /// Recomputes and stores scores of all participants over \param window
    outcome::result<std::vector<primitives::Score>> computeScores(
        std::chrono::milliseconds window);

    outcome::result<std::vector<primitives::Score>> computeScores() {
      return computeScores(config_.window);
    }

    const ScoringConfig &config() const {
      return config_;
    }

   private:
    ScoringConfig config_;
    std::shared_ptr<storage::OutcomeRepository> outcomes_;
    std::shared_ptr<storage::ParticipantRepository> participants_;
    std::shared_ptr<storage::ScoreRepository> scores_;
    std::shared_ptr<clock::SystemClock> clock_;
    log::Logger logger_;
  };

}  // namespace nineteen::scoring
