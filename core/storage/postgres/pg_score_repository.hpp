/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/score_repository.hpp"

#include "storage/postgres/pg_connection_pool.hpp"

namespace nineteen::storage {

  class PgScoreRepository : public ScoreRepository {
   public:
    explicit PgScoreRepository(std::shared_ptr<PgConnectionPool> pool);

    outcome::result<void> replaceAll(
        const std::vector<primitives::Score> &scores) override;

    outcome::result<std::vector<primitives::Score>> getAll() const override;

   private:
    std::shared_ptr<PgConnectionPool> pool_;
  };

}  // namespace nineteen::storage
