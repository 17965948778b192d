/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scoring/weight_setter.hpp"

#include <algorithm>
#include <unordered_map>

#include <boost/assert.hpp>

#include "common/error_class.hpp"
#include "scoring/scoring_error.hpp"

namespace nineteen::scoring {

  namespace {
    constexpr auto kSubmissionsMetric = "nineteen_weight_submissions_total";
  }

  std::vector<primitives::WeightEntry> normalizeWeights(
      const std::vector<primitives::Participant> &participants,
      const std::vector<primitives::Score> &scores) {
    std::unordered_map<primitives::Hotkey, double> score_of;
    for (auto &score : scores) {
      score_of[score.hotkey] = std::max(score.value, 0.);
    }

    std::vector<primitives::WeightEntry> weights;
    double total = 0.;
    for (auto &participant : participants) {
      if (not participant.eligible) {
        continue;
      }
      auto it = score_of.find(participant.hotkey);
      auto value = it == score_of.end() ? 0. : it->second;
      total += value;
      weights.emplace_back(primitives::WeightEntry{
          .node_id = participant.node_id,
          .hotkey = participant.hotkey,
          .weight = value,
      });
    }
    std::sort(weights.begin(),
              weights.end(),
              [](const auto &lhs, const auto &rhs) {
                return lhs.node_id < rhs.node_id;
              });

    for (auto &entry : weights) {
      entry.weight = total > 0. ? entry.weight / total
                                : 1. / static_cast<double>(weights.size());
    }
    return weights;
  }

  WeightSetter::WeightSetter(
      WeightSetterConfig config,
      std::shared_ptr<chain::ChainClient> chain_client,
      std::shared_ptr<storage::ParticipantRepository> participants,
      std::shared_ptr<storage::ScoreRepository> scores,
      std::shared_ptr<storage::WeightSubmissionRepository> submissions,
      std::shared_ptr<clock::SystemClock> clock)
      : config_{config},
        chain_client_{std::move(chain_client)},
        participants_{std::move(participants)},
        scores_{std::move(scores)},
        submissions_{std::move(submissions)},
        clock_{std::move(clock)},
        logger_{log::createLogger("WeightSetter", "scoring")} {
    BOOST_ASSERT(chain_client_ != nullptr);
    BOOST_ASSERT(participants_ != nullptr);
    BOOST_ASSERT(scores_ != nullptr);
    BOOST_ASSERT(submissions_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);

    metrics_registry_->registerCounterFamily(kSubmissionsMetric,
                                             "Weight submissions by result");
    metric_submitted_ = metrics_registry_->registerCounterMetric(
        kSubmissionsMetric, {{"status", "submitted"}});
    metric_failed_ = metrics_registry_->registerCounterMetric(
        kSubmissionsMetric, {{"status", "failed"}});
  }

  void WeightSetter::stop() {
    stop_signal_.stop();
  }

  outcome::result<void> WeightSetter::submitWeights(primitives::Epoch epoch) {
    OUTCOME_TRY(existing, submissions_->get(epoch));
    if (existing
        and existing->status == primitives::SubmissionStatus::Submitted) {
      SL_INFO(logger_,
              "Weights of epoch {} are already submitted: {}",
              epoch,
              make_error_code(ScoringError::ALREADY_SUBMITTED).message());
      return outcome::success();
    }

    OUTCOME_TRY(participants, participants_->getAll());
    OUTCOME_TRY(scores, scores_->getAll());
    auto weights = normalizeWeights(participants, scores);
    if (weights.empty()) {
      SL_WARN(logger_, "No eligible participants to weight in epoch {}", epoch);
      return ScoringError::NO_ELIGIBLE_PARTICIPANTS;
    }

    primitives::WeightSubmission submission{
        .epoch = epoch,
        .weights = std::move(weights),
        .attempts = existing ? existing->attempts : 0,
    };

    for (uint32_t attempt = 1; attempt <= config_.max_attempts; ++attempt) {
      ++submission.attempts;
      auto tx_ref = chain_client_->submitWeights(epoch, submission.weights);
      if (tx_ref.has_value()) {
        submission.tx_ref = std::move(tx_ref.value());
        submission.status = primitives::SubmissionStatus::Submitted;
        submission.submitted_at = clock_->now();
        OUTCOME_TRY(stored, submissions_->store(submission));
        if (not stored) {
          SL_INFO(logger_,
                  "Epoch {} was submitted concurrently, keeping that record",
                  epoch);
        }
        metric_submitted_->inc();
        SL_INFO(logger_,
                "Submitted weights of {} participants for epoch {} in tx {}",
                submission.weights.size(),
                epoch,
                submission.tx_ref.value());
        return outcome::success();
      }

      SL_WARN(logger_,
              "Weight submission for epoch {} failed (attempt {}/{}): {}",
              epoch,
              attempt,
              config_.max_attempts,
              tx_ref.error().message());
      if (not isTransient(tx_ref.error())) {
        break;
      }
      if (attempt < config_.max_attempts
          and stop_signal_.waitFor(backoffDelay(config_.backoff, attempt))) {
        break;
      }
    }

    return storeFailure(std::move(submission));
  }

  outcome::result<void> WeightSetter::storeFailure(
      primitives::WeightSubmission submission) {
    submission.status = primitives::SubmissionStatus::Failed;
    submission.submitted_at = clock_->now();
    submission.tx_ref.reset();
    OUTCOME_TRY(submissions_->store(submission));
    metric_failed_->inc();
    SL_ERROR(logger_,
             "Weights of epoch {} were not submitted after {} attempts",
             submission.epoch,
             submission.attempts);
    return ScoringError::SUBMISSION_FAILED;
  }

}  // namespace nineteen::scoring
