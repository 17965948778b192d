/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nineteen::chain {

  /// Errors of the chain interface
  enum class ChainError {
    BAD_RESPONSE = 1,
    RPC_ERROR,
    REJECTED,
  };

  /// Errors of the chain sync agent
  enum class SyncError {
    SYNC_IN_PROGRESS = 1,
  };

}  // namespace nineteen::chain

OUTCOME_HPP_DECLARE_ERROR(nineteen::chain, ChainError);
OUTCOME_HPP_DECLARE_ERROR(nineteen::chain, SyncError);
