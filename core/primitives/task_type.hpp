/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

namespace nineteen::primitives {

  /**
   * Kind of work the subnet serves, e.g. a chat model or an image model
   */
  struct TaskType {
    std::string name;

    /// How many capacity units one request consumes
    double volume_to_requests{1.0};

    /// Capacity units each eligible participant declares per scoring period
    double capacity_per_participant{0.0};

    /// Deadline of a task relative to its submission
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};

    bool enabled{true};
  };

}  // namespace nineteen::primitives
