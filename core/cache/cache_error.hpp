/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nineteen::cache {

  enum class CacheError {
    CONNECTION_FAILED = 1,
    TIMEOUT,
    PROTOCOL_ERROR,
    SERVER_ERROR,
    LIST_FULL,
    UNEXPECTED_REPLY,
  };

}  // namespace nineteen::cache

OUTCOME_HPP_DECLARE_ERROR(nineteen::cache, CacheError);
