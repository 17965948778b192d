/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/participant.hpp"

namespace nineteen::primitives {

  /// Rolling aggregate of a participant's outcomes
  struct Score {
    Hotkey hotkey;
    double value{};

    /// Number of outcomes the value is computed from
    uint32_t samples{};

    Timestamp computed_at{};

    bool operator==(const Score &other) const = default;
  };

}  // namespace nineteen::primitives
