/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/weight_submission_repository.hpp"

#include "log/logger.hpp"
#include "storage/postgres/pg_connection_pool.hpp"

namespace nineteen::storage {

  /**
   * Weight submissions keyed by epoch. A row with status Submitted is never
   * overwritten, failed rows are replaced by later attempts.
   */
  class PgWeightSubmissionRepository : public WeightSubmissionRepository {
   public:
    explicit PgWeightSubmissionRepository(
        std::shared_ptr<PgConnectionPool> pool);

    outcome::result<std::optional<primitives::WeightSubmission>> get(
        primitives::Epoch epoch) const override;

    outcome::result<bool> store(
        const primitives::WeightSubmission &submission) override;

   private:
    std::shared_ptr<PgConnectionPool> pool_;
    log::Logger logger_;
  };

}  // namespace nineteen::storage
