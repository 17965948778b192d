/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nineteen::dispatch {

  enum class DispatchError {
    INVALID_TASK = 1,
    QUEUE_FULL,
    MALFORMED_MESSAGE,
    WORKER_FAILED,
  };

}  // namespace nineteen::dispatch

OUTCOME_HPP_DECLARE_ERROR(nineteen::dispatch, DispatchError);
