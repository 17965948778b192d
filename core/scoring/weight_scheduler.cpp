/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scoring/weight_scheduler.hpp"

#include <boost/assert.hpp>

namespace nineteen::scoring {

  primitives::Epoch epochAt(const EpochConfig &config,
                            primitives::Timestamp now) {
    if (now < config.origin or config.length.count() <= 0) {
      return 0;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - config.origin);
    return static_cast<primitives::Epoch>(elapsed / config.length);
  }

  WeightScheduler::WeightScheduler(
      application::AppStateManager &app_state_manager,
      EpochConfig epoch_config,
      std::shared_ptr<ScoringEngine> engine,
      std::shared_ptr<WeightSetter> setter,
      std::shared_ptr<clock::SystemClock> clock,
      std::shared_ptr<clock::Ticker> ticker)
      : epoch_config_{epoch_config},
        engine_{std::move(engine)},
        setter_{std::move(setter)},
        clock_{std::move(clock)},
        ticker_{std::move(ticker)},
        logger_{log::createLogger("WeightScheduler", "scoring")} {
    BOOST_ASSERT(engine_ != nullptr);
    BOOST_ASSERT(setter_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
    BOOST_ASSERT(ticker_ != nullptr);
    app_state_manager.takeControl(*this);
  }

  bool WeightScheduler::start() {
    ticker_->onTick([this](const std::error_code &ec) {
      if (ec) {
        SL_ERROR(logger_, "Weight timer failed: {}", ec.message());
        return;
      }
      if (auto res = runOnce(); res.has_error()) {
        SL_WARN(logger_, "Weight round failed: {}", res.error().message());
      }
    });
    ticker_->start(std::chrono::milliseconds::zero());
    return true;
  }

  void WeightScheduler::stop() {
    setter_->stop();
    ticker_->stop();
  }

  outcome::result<void> WeightScheduler::runOnce() {
    auto epoch = epochAt(epoch_config_, clock_->now());
    SL_DEBUG(logger_, "Weight round for epoch {}", epoch);
    OUTCOME_TRY(engine_->computeScores());
    return setter_->submitWeights(epoch);
  }

}  // namespace nineteen::scoring
