/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/participant_repository.hpp"

#include "log/logger.hpp"
#include "storage/postgres/pg_connection_pool.hpp"

namespace nineteen::storage {

  class PgParticipantRepository : public ParticipantRepository {
   public:
    explicit PgParticipantRepository(std::shared_ptr<PgConnectionPool> pool);

    outcome::result<void> replaceAll(
        const std::vector<primitives::Participant> &participants,
        primitives::Timestamp now) override;

    outcome::result<std::vector<primitives::Participant>> getAll()
        const override;

   private:
    std::shared_ptr<PgConnectionPool> pool_;
    log::Logger logger_;
  };

}  // namespace nineteen::storage
