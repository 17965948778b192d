/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nineteen::gateway {

  /// Caller-visible failures of the intake gateway
  enum class GatewayError {
    REJECTED = 1,
    UNAUTHORIZED,
    OVERLOADED,
    RATE_LIMITED,
    TIMEOUT,
  };

}  // namespace nineteen::gateway

OUTCOME_HPP_DECLARE_ERROR(nineteen::gateway, GatewayError);
