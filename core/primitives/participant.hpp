/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

#include "clock/clock.hpp"

namespace nineteen::primitives {

  /// Network key of a participant
  using Hotkey = std::string;

  /// Index of a participant in the subnet
  using NodeId = uint16_t;

  using Timestamp = clock::SystemClock::TimePoint;

  /**
   * Registered worker identity as seen on chain. Written only by the chain
   * sync agent.
   */
  struct Participant {
    Hotkey hotkey;
    std::string coldkey;
    NodeId node_id{};
    uint16_t netuid{};

    /// Stake weight
    double stake{};
    double incentive{};
    double trust{};
    double vtrust{};

    /// Block of the last registration update
    uint64_t registration_block{};

    std::string ip;
    uint8_t ip_type{};
    uint16_t port{};
    uint8_t protocol{};

    /// Whether tasks may be dispatched to the participant
    bool eligible{false};

    Timestamp last_updated{};

    bool operator==(const Participant &other) const = default;
  };

}  // namespace nineteen::primitives
