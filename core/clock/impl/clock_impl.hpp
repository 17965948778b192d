/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace nineteen::clock {

  template <typename ClockType>
  class ClockImpl final : public Clock<ClockType> {
   public:
    typename Clock<ClockType>::TimePoint now() const override {
      return ClockType::now();
    }
  };

  using SteadyClockImpl = ClockImpl<std::chrono::steady_clock>;
  using SystemClockImpl = ClockImpl<std::chrono::system_clock>;

}  // namespace nineteen::clock
