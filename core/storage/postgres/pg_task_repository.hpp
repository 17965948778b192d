/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/task_repository.hpp"

#include "log/logger.hpp"
#include "storage/postgres/pg_connection_pool.hpp"

namespace nineteen::storage {

  class PgTaskRepository : public TaskRepository {
   public:
    explicit PgTaskRepository(std::shared_ptr<PgConnectionPool> pool);

    outcome::result<void> insert(const primitives::Task &task) override;

    outcome::result<std::optional<primitives::Task>> get(
        const primitives::TaskId &id) const override;

    outcome::result<bool> update(const primitives::Task &task,
                                 primitives::TaskStatus expected) override;

    outcome::result<void> remove(const primitives::TaskId &id) override;

    outcome::result<std::vector<primitives::Task>> getNonTerminal()
        const override;

   private:
    std::shared_ptr<PgConnectionPool> pool_;
    log::Logger logger_;
  };

}  // namespace nineteen::storage
