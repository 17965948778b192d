/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "outcome/outcome.hpp"
#include "primitives/weight_submission.hpp"

namespace nineteen::storage {

  /**
   * History of weight submissions, one row per epoch
   */
  class WeightSubmissionRepository {
   public:
    virtual ~WeightSubmissionRepository() = default;

    virtual outcome::result<std::optional<primitives::WeightSubmission>> get(
        primitives::Epoch epoch) const = 0;

    /**
     * Writes the submission unless the epoch already has a submitted one
     * @return false if a submitted row for the epoch exists
     */
    virtual outcome::result<bool> store(
        const primitives::WeightSubmission &submission) = 0;
  };

}  // namespace nineteen::storage
