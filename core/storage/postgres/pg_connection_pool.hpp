/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <mutex>
#include <vector>

#include "log/logger.hpp"
#include "storage/database_error.hpp"
#include "storage/postgres/pg_connection.hpp"

namespace nineteen::storage {

  struct PostgresConfig {
    std::string host{"localhost"};
    uint16_t port{5432};
    std::string user{"postgres"};
    std::string password;
    std::string database{"postgres"};
    std::chrono::seconds connect_timeout{5};

    /// Server side limit of every statement
    std::chrono::milliseconds statement_timeout{std::chrono::seconds(10)};

    size_t max_idle_connections{4};

    std::string conninfo() const;
  };

  /**
   * Hands out connections to one thread at a time. Connections are created on
   * demand; up to max_idle_connections healthy ones are kept for reuse.
   */
  class PgConnectionPool {
   public:
    explicit PgConnectionPool(PostgresConfig config);

    outcome::result<std::unique_ptr<PgConnection>> acquire();

    void release(std::unique_ptr<PgConnection> connection);

    template <typename F>
    auto withConnection(F &&f) -> decltype(f(std::declval<PgConnection &>())) {
      OUTCOME_TRY(connection, acquire());
      auto result = std::forward<F>(f)(*connection);
      release(std::move(connection));
      return result;
    }

    /**
     * Runs \param f inside BEGIN/COMMIT; rolls back if f fails
     */
    template <typename F>
    auto withTransaction(F &&f)
        -> decltype(f(std::declval<PgConnection &>())) {
      return withConnection(
          [&](PgConnection &connection)
              -> decltype(f(std::declval<PgConnection &>())) {
            OUTCOME_TRY(connection.exec("BEGIN"));
            auto result = std::forward<F>(f)(connection);
            if (result.has_error()) {
              if (auto rollback = connection.exec("ROLLBACK");
                  rollback.has_error()) {
                SL_WARN(logger_,
                        "Rollback failed: {}",
                        rollback.error().message());
              }
              return result;
            }
            if (auto commit = connection.exec("COMMIT"); commit.has_error()) {
              SL_WARN(logger_, "Commit failed: {}", commit.error().message());
              return DatabaseError::TRANSACTION_FAILED;
            }
            return result;
          });
    }

   private:
    PostgresConfig config_;
    std::string conninfo_;
    std::mutex mutex_;
    std::vector<std::unique_ptr<PgConnection>> idle_;
    log::Logger logger_;
  };

}  // namespace nineteen::storage
