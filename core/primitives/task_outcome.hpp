/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include "primitives/task.hpp"

namespace nineteen::primitives {

  /**
   * Result of dispatching a task to a participant. Append-only, unique per
   * (task_id, hotkey).
   */
  struct TaskOutcome {
    TaskId task_id;
    Hotkey hotkey;
    std::chrono::milliseconds latency{};
    bool success{false};

    /// In range [0, 1]
    double quality{};

    Timestamp timestamp{};

    bool operator==(const TaskOutcome &other) const = default;
  };

}  // namespace nineteen::primitives
