/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/task_outcome.hpp"

namespace nineteen::storage {

  /**
   * Append-only log of task outcomes
   */
  class OutcomeRepository {
   public:
    virtual ~OutcomeRepository() = default;

    /**
     * @return false if an outcome for the same (task, participant) already
     * exists, in which case nothing is written
     */
    virtual outcome::result<bool> insert(
        const primitives::TaskOutcome &outcome) = 0;

    /// Outcomes with timestamp not earlier than \param since
    virtual outcome::result<std::vector<primitives::TaskOutcome>> getSince(
        primitives::Timestamp since) const = 0;

    virtual outcome::result<std::vector<primitives::TaskOutcome>> getForTask(
        const primitives::TaskId &task_id) const = 0;
  };

}  // namespace nineteen::storage
