/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "primitives/participant.hpp"

namespace nineteen::primitives {

  using Epoch = uint64_t;

  struct WeightEntry {
    NodeId node_id{};
    Hotkey hotkey;
    double weight{};

    bool operator==(const WeightEntry &other) const = default;
  };

  enum class SubmissionStatus : uint8_t {
    Submitted = 0,
    Failed = 1,
  };

  /**
   * Weight vector submitted for an epoch. At most one submission per epoch
   * has status Submitted.
   */
  struct WeightSubmission {
    Epoch epoch{};
    std::vector<WeightEntry> weights;
    Timestamp submitted_at{};
    std::optional<std::string> tx_ref;
    SubmissionStatus status{SubmissionStatus::Failed};
    uint32_t attempts{};

    bool operator==(const WeightSubmission &other) const = default;
  };

}  // namespace nineteen::primitives
