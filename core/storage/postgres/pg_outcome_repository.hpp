/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/outcome_repository.hpp"

#include "storage/postgres/pg_connection_pool.hpp"

namespace nineteen::storage {

  class PgOutcomeRepository : public OutcomeRepository {
   public:
    explicit PgOutcomeRepository(std::shared_ptr<PgConnectionPool> pool);

    outcome::result<bool> insert(
        const primitives::TaskOutcome &outcome) override;

    outcome::result<std::vector<primitives::TaskOutcome>> getSince(
        primitives::Timestamp since) const override;

    outcome::result<std::vector<primitives::TaskOutcome>> getForTask(
        const primitives::TaskId &task_id) const override;

   private:
    outcome::result<std::vector<primitives::TaskOutcome>> select(
        std::string_view condition, const PgParams &params) const;

    std::shared_ptr<PgConnectionPool> pool_;
  };

}  // namespace nineteen::storage
