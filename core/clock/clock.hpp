/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace nineteen::clock {

  /// Source of the current time, replaced by a manual clock in tests
  template <typename ClockType>
  class Clock {
   public:
    using Duration = typename ClockType::duration;
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
  };

  /// Lease expiry and other intervals local to the process
  using SteadyClock = Clock<std::chrono::steady_clock>;

  /// Timestamps stored in the state store or sent to other nodes
  using SystemClock = Clock<std::chrono::system_clock>;

  /// Milliseconds since the Unix epoch, the form timestamps are persisted in
  inline int64_t toMillis(SystemClock::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
  }

  inline SystemClock::TimePoint fromMillis(int64_t millis) {
    return SystemClock::TimePoint{std::chrono::duration_cast<
        SystemClock::Duration>(std::chrono::milliseconds{millis})};
  }

}  // namespace nineteen::clock
