/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "storage/postgres/pg_connection_pool.hpp"

namespace nineteen::storage::migrations {

  /// Schema version every service requires before it starts
  constexpr uint32_t kRequiredSchemaVersion = 3;

  struct Migration {
    uint32_t version;
    std::string_view description;
    std::vector<std::string_view> statements;
  };

  /// Forward-only migrations ordered by version
  const std::vector<Migration> &allMigrations();

  /**
   * Applies schema migrations and checks the applied version
   */
  class Migrator {
   public:
    explicit Migrator(std::shared_ptr<PgConnectionPool> pool);

    /// Highest applied version, 0 for an empty database
    outcome::result<uint32_t> currentVersion() const;

    /**
     * Applies every migration above the current version, each one in its own
     * transaction. Concurrent migrators are serialized by an advisory lock.
     * @return resulting schema version
     */
    outcome::result<uint32_t> migrate();

    /**
     * Fails with SCHEMA_MISMATCH unless the database is at \param required
     */
    outcome::result<void> ensureVersion(
        uint32_t required = kRequiredSchemaVersion) const;

   private:
    std::shared_ptr<PgConnectionPool> pool_;
    log::Logger logger_;
  };

}  // namespace nineteen::storage::migrations
