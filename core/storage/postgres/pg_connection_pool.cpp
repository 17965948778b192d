/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/postgres/pg_connection_pool.hpp"

#include <fmt/format.h>

namespace nineteen::storage {

  namespace {
    // libpq keyword/value string needs quoting of values with spaces
    std::string quote(std::string_view value) {
      std::string result = "'";
      for (auto ch : value) {
        if (ch == '\'' or ch == '\\') {
          result += '\\';
        }
        result += ch;
      }
      result += '\'';
      return result;
    }
  }  // namespace

  std::string PostgresConfig::conninfo() const {
    return fmt::format(
        "host={} port={} user={} password={} dbname={} connect_timeout={} "
        "options={}",
        quote(host),
        port,
        quote(user),
        quote(password),
        quote(database),
        connect_timeout.count(),
        quote(fmt::format("-c statement_timeout={}",
                          statement_timeout.count())));
  }

  PgConnectionPool::PgConnectionPool(PostgresConfig config)
      : config_{std::move(config)},
        conninfo_{config_.conninfo()},
        logger_{log::createLogger("PgConnectionPool", "postgres")} {}

  outcome::result<std::unique_ptr<PgConnection>> PgConnectionPool::acquire() {
    {
      std::lock_guard lock(mutex_);
      while (not idle_.empty()) {
        auto connection = std::move(idle_.back());
        idle_.pop_back();
        if (connection->isConnected()) {
          return connection;
        }
      }
    }
    auto connection = std::make_unique<PgConnection>(conninfo_);
    OUTCOME_TRY(connection->connect());
    SL_TRACE(logger_, "New connection to {}:{}", config_.host, config_.port);
    return connection;
  }

  void PgConnectionPool::release(std::unique_ptr<PgConnection> connection) {
    if (not connection or not connection->isConnected()) {
      return;
    }
    std::lock_guard lock(mutex_);
    if (idle_.size() < config_.max_idle_connections) {
      idle_.emplace_back(std::move(connection));
    }
  }

}  // namespace nineteen::storage
