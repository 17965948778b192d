/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scoring/scoring_engine.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>

#include <boost/assert.hpp>

namespace nineteen::scoring {

  namespace {
    struct Accumulator {
      double weighted_quality = 0.;
      double weight = 0.;
      uint32_t samples = 0;
    };
  }  // namespace

  std::vector<primitives::Score> aggregateScores(
      std::vector<primitives::TaskOutcome> outcomes,
      const std::vector<primitives::Hotkey> &hotkeys,
      primitives::Timestamp now,
      const ScoringConfig &config) {
    std::sort(outcomes.begin(),
              outcomes.end(),
              [](const auto &lhs, const auto &rhs) {
                return std::tie(lhs.hotkey, lhs.task_id)
                     < std::tie(rhs.hotkey, rhs.task_id);
              });

    const auto half_life = static_cast<double>(config.half_life.count());
    std::map<primitives::Hotkey, Accumulator> sums;
    for (auto &outcome : outcomes) {
      auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
          now - outcome.timestamp);
      auto age_ms = static_cast<double>(std::max(age.count(), int64_t{0}));
      auto w = half_life > 0 ? std::exp2(-age_ms / half_life) : 1.;
      auto q = outcome.success ? std::clamp(outcome.quality, 0., 1.) : 0.;
      auto &acc = sums[outcome.hotkey];
      acc.weighted_quality += w * q;
      acc.weight += w;
      ++acc.samples;
    }

    std::vector<primitives::Score> scores;
    scores.reserve(hotkeys.size());
    for (auto &hotkey : hotkeys) {
      primitives::Score score{
          .hotkey = hotkey,
          .value = config.baseline,
          .samples = 0,
          .computed_at = now,
      };
      if (auto it = sums.find(hotkey); it != sums.end()) {
        auto &acc = it->second;
        score.value =
            (acc.weighted_quality + config.prior_weight * config.baseline)
            / (acc.weight + config.prior_weight);
        score.samples = acc.samples;
      }
      scores.emplace_back(std::move(score));
    }
    return scores;
  }

  ScoringEngine::ScoringEngine(
      ScoringConfig config,
      std::shared_ptr<storage::OutcomeRepository> outcomes,
      std::shared_ptr<storage::ParticipantRepository> participants,
      std::shared_ptr<storage::ScoreRepository> scores,
      std::shared_ptr<clock::SystemClock> clock)
      : config_{config},
        outcomes_{std::move(outcomes)},
        participants_{std::move(participants)},
        scores_{std::move(scores)},
        clock_{std::move(clock)},
        logger_{log::createLogger("ScoringEngine", "scoring")} {
    BOOST_ASSERT(outcomes_ != nullptr);
    BOOST_ASSERT(participants_ != nullptr);
    BOOST_ASSERT(scores_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
  }

  outcome::result<void> ScoringEngine::recordOutcome(
      const primitives::TaskOutcome &outcome) {
    OUTCOME_TRY(inserted, outcomes_->insert(outcome));
    if (not inserted) {
      SL_DEBUG(logger_,
               "Outcome of task {} by {} is already recorded",
               outcome.task_id,
               outcome.hotkey);
    }
    return outcome::success();
  }

  outcome::result<std::vector<primitives::Score>> ScoringEngine::computeScores(
      std::chrono::milliseconds window) {
    auto now = clock_->now();
    OUTCOME_TRY(outcomes, outcomes_->getSince(now - window));
    OUTCOME_TRY(participants, participants_->getAll());

    std::vector<primitives::Hotkey> hotkeys;
    hotkeys.reserve(participants.size());
    for (auto &participant : participants) {
      hotkeys.emplace_back(participant.hotkey);
    }

    auto outcome_count = outcomes.size();
    auto scores = aggregateScores(std::move(outcomes), hotkeys, now, config_);
    OUTCOME_TRY(scores_->replaceAll(scores));

    SL_INFO(logger_,
            "Computed scores of {} participants from {} outcomes",
            scores.size(),
            outcome_count);
    return scores;
  }

}  // namespace nineteen::scoring
