/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scoring/scoring_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nineteen::scoring, ScoringError, e) {
  using E = nineteen::scoring::ScoringError;
  switch (e) {
    case E::NO_ELIGIBLE_PARTICIPANTS:
      return "There are no eligible participants to weight";
    case E::SUBMISSION_FAILED:
      return "Weight submission failed after all retries";
    case E::ALREADY_SUBMITTED:
      return "Weights for the epoch are already submitted";
  }
  return "Unknown scoring error";
}
