/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispatch/participant_selector.hpp"

#include <algorithm>

namespace nineteen::dispatch {

  ParticipantSelector::ParticipantSelector(Config config)
      : ParticipantSelector(config, std::random_device{}()) {}

  ParticipantSelector::ParticipantSelector(Config config, uint64_t seed)
      : config_{config}, random_gen_{seed} {}

  void ParticipantSelector::update(
      const std::vector<primitives::Participant> &participants,
      const std::vector<primitives::Score> &scores) {
    std::unordered_map<primitives::Hotkey, double> score_of;
    for (auto &score : scores) {
      score_of.emplace(score.hotkey, score.value);
    }

    std::vector<Candidate> candidates;
    for (auto &participant : participants) {
      if (not participant.eligible) {
        continue;
      }
      auto it = score_of.find(participant.hotkey);
      auto weight =
          it == score_of.end() ? config_.unscored_weight : it->second;
      candidates.emplace_back(
          Candidate{participant, std::max(weight, config_.min_weight)});
    }

    std::lock_guard lock(mutex_);
    candidates_ = std::move(candidates);
  }

  std::optional<primitives::Participant> ParticipantSelector::select(
      const std::set<primitives::Hotkey> &excluded) {
    std::lock_guard lock(mutex_);
    double total = 0.;
    for (auto &candidate : candidates_) {
      if (not excluded.contains(candidate.participant.hotkey)) {
        total += candidate.weight;
      }
    }
    if (total <= 0.) {
      return std::nullopt;
    }

    auto point = std::uniform_real_distribution<double>{0., total}(random_gen_);
    const Candidate *last = nullptr;
    for (auto &candidate : candidates_) {
      if (excluded.contains(candidate.participant.hotkey)) {
        continue;
      }
      last = &candidate;
      if (point < candidate.weight) {
        break;
      }
      point -= candidate.weight;
    }
    return last->participant;
  }

  size_t ParticipantSelector::size() const {
    std::lock_guard lock(mutex_);
    return candidates_.size();
  }

}  // namespace nineteen::dispatch
