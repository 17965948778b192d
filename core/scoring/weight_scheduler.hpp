/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "application/app_state_manager.hpp"
#include "clock/ticker.hpp"
#include "scoring/scoring_engine.hpp"
#include "scoring/weight_setter.hpp"

namespace nineteen::scoring {

  struct EpochConfig {
    /// Start of epoch 0
    primitives::Timestamp origin{};

    std::chrono::milliseconds length{std::chrono::minutes(72)};
  };

  /// floor((now - origin) / length), 0 before the origin
  primitives::Epoch epochAt(const EpochConfig &config,
                            primitives::Timestamp now);

  /**
   * Periodically recomputes scores and submits the weights of the current
   * epoch
   */
  class WeightScheduler {
   public:
    WeightScheduler(application::AppStateManager &app_state_manager,
                    EpochConfig epoch_config,
                    std::shared_ptr<ScoringEngine> engine,
                    std::shared_ptr<WeightSetter> setter,
                    std::shared_ptr<clock::SystemClock> clock,
                    std::shared_ptr<clock::Ticker> ticker);

    bool start();
    void stop();

    /// Scores and weights for the epoch of the current moment
    outcome::result<void> runOnce();

   private:
    EpochConfig epoch_config_;
    std::shared_ptr<ScoringEngine> engine_;
    std::shared_ptr<WeightSetter> setter_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<clock::Ticker> ticker_;
    log::Logger logger_;
  };

}  // namespace nineteen::scoring
