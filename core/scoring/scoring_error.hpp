/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nineteen::scoring {

  enum class ScoringError {
    NO_ELIGIBLE_PARTICIPANTS = 1,
    SUBMISSION_FAILED,
    ALREADY_SUBMITTED,
  };

}  // namespace nineteen::scoring

OUTCOME_HPP_DECLARE_ERROR(nineteen::scoring, ScoringError);
