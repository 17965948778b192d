/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace nineteen {

  struct BackoffPolicy {
    std::chrono::milliseconds base{100};
    std::chrono::milliseconds max{std::chrono::seconds(5)};
  };

  /**
   * Delay before retry number \param attempt (counting from 1):
   * base * 2^(attempt-1), capped by policy.max
   */
  inline std::chrono::milliseconds backoffDelay(const BackoffPolicy &policy,
                                                uint32_t attempt) {
    if (attempt == 0) {
      return std::chrono::milliseconds::zero();
    }
    auto delay = policy.base;
    for (uint32_t i = 1; i < attempt and delay < policy.max; ++i) {
      delay *= 2;
    }
    return std::min(delay, policy.max);
  }

}  // namespace nineteen
