/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/task.hpp"

namespace nineteen::storage {

  class TaskRepository {
   public:
    virtual ~TaskRepository() = default;

    /// Fails with DatabaseError::DUPLICATE_KEY if id is taken
    virtual outcome::result<void> insert(const primitives::Task &task) = 0;

    virtual outcome::result<std::optional<primitives::Task>> get(
        const primitives::TaskId &id) const = 0;

    /**
     * Compare-and-set update of status, assigned participant and attempts
     * @param task new state of the task
     * @param expected status the stored task must have
     * @return false if the stored task has another status or is terminal
     */
    virtual outcome::result<bool> update(const primitives::Task &task,
                                         primitives::TaskStatus expected) = 0;

    /// Removes task which was never dispatched
    virtual outcome::result<void> remove(const primitives::TaskId &id) = 0;

    /// Pending and dispatched tasks
    virtual outcome::result<std::vector<primitives::Task>> getNonTerminal()
        const = 0;
  };

}  // namespace nineteen::storage
