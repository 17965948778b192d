/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

#include <atomic>

#include <gmock/gmock.h>

namespace nineteen::clock {

  class SystemClockMock : public SystemClock {
   public:
    MOCK_METHOD(TimePoint, now, (), (const, override));
  };

  /**
   * Clock standing still until moved by a test
   */
  template <typename ClockType>
  class ManualClockOf : public Clock<ClockType> {
   public:
    using typename Clock<ClockType>::Duration;
    using typename Clock<ClockType>::TimePoint;

    explicit ManualClockOf(TimePoint start = TimePoint{})
        : now_{start.time_since_epoch().count()} {}

    TimePoint now() const override {
      return TimePoint{Duration{now_.load()}};
    }

    void advance(std::chrono::milliseconds delta) {
      now_ += std::chrono::duration_cast<Duration>(delta).count();
    }

    void set(TimePoint tp) {
      now_ = tp.time_since_epoch().count();
    }

   private:
    std::atomic<typename Duration::rep> now_;
  };

  class ManualClock : public ManualClockOf<std::chrono::system_clock> {
   public:
    explicit ManualClock(TimePoint start = fromMillis(1'700'000'000'000))
        : ManualClockOf{start} {}
  };

  using ManualSteadyClock = ManualClockOf<std::chrono::steady_clock>;

}  // namespace nineteen::clock
