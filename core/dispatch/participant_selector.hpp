/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <unordered_map>
#include <vector>

#include "primitives/participant.hpp"
#include "primitives/score.hpp"

namespace nineteen::dispatch {

  /**
   * Picks eligible participants at random with probability proportional to
   * their score. Thread safe.
   */
  class ParticipantSelector {
   public:
    struct Config {
      /// Weight of participants without a score
      double unscored_weight{0.5};

      /// Lowest weight, keeps low scored participants reachable
      double min_weight{0.01};
    };

    explicit ParticipantSelector(Config config);
    ParticipantSelector(Config config, uint64_t seed);

    /// Replaces the candidate set, non eligible participants are ignored
    void update(const std::vector<primitives::Participant> &participants,
                const std::vector<primitives::Score> &scores);

    /// @return nullopt if every candidate is in \param excluded
    std::optional<primitives::Participant> select(
        const std::set<primitives::Hotkey> &excluded);

    size_t size() const;

   private:
    struct Candidate {
      primitives::Participant participant;
      double weight;
    };

    Config config_;
    mutable std::mutex mutex_;
    std::vector<Candidate> candidates_;
    std::mt19937_64 random_gen_;
  };

}  // namespace nineteen::dispatch
