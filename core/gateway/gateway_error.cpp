/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/gateway_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nineteen::gateway, GatewayError, e) {
  using E = nineteen::gateway::GatewayError;
  switch (e) {
    case E::REJECTED:
      return "Rejected";
    case E::UNAUTHORIZED:
      return "Unauthorized";
    case E::OVERLOADED:
      return "Overloaded";
    case E::RATE_LIMITED:
      return "Overloaded: request rate limit exceeded";
    case E::TIMEOUT:
      return "Timeout";
  }
  return "Unknown gateway error";
}
