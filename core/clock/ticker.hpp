/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <system_error>

#include "clock/clock.hpp"

namespace nineteen::clock {

  /**
   * Periodic timer of background loops, e.g. chain sync or weight setting.
   * The next interval is counted from the end of the previous callback, so a
   * slow callback delays the next tick instead of overlapping with it.
   */
  class Ticker {
   public:
    using Callback = std::function<void(const std::error_code &)>;

    virtual ~Ticker() = default;

    /// Sets the callback, ignored while running
    virtual void onTick(Callback cb) = 0;

    /// First tick comes after \param delay, ignored without a callback
    virtual void start(SteadyClock::Duration delay) = 0;

    /// No tick is delivered after this returns, except one already running
    virtual void stop() = 0;

    virtual bool running() const = 0;
  };

}  // namespace nineteen::clock
