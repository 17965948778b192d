/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <libpq-fe.h>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace nineteen::storage {

  /// Positional text parameters of a query, nullopt is SQL NULL
  using PgParams = std::vector<std::optional<std::string>>;

  /**
   * Owning wrapper over PGresult
   */
  class PgResult {
   public:
    explicit PgResult(PGresult *result);

    ExecStatusType status() const;
    std::string_view sqlState() const;
    std::string_view errorMessage() const;

    int rows() const;

    /// Number of rows touched by INSERT/UPDATE/DELETE
    uint64_t affectedRows() const;

    bool isNull(int row, int column) const;
    std::string_view text(int row, int column) const;
    std::optional<std::string> optionalText(int row, int column) const;

    outcome::result<int64_t> integer(int row, int column) const;
    outcome::result<double> real(int row, int column) const;
    bool boolean(int row, int column) const;

   private:
    std::unique_ptr<PGresult, decltype(&PQclear)> result_;
  };

  /**
   * Single blocking connection to Postgres. Not thread safe, handed out by
   * PgConnectionPool to one user at a time.
   */
  class PgConnection {
   public:
    explicit PgConnection(std::string conninfo);

    PgConnection(const PgConnection &) = delete;
    PgConnection &operator=(const PgConnection &) = delete;

    outcome::result<void> connect();

    bool isConnected() const;

    outcome::result<PgResult> exec(std::string_view sql,
                                   const PgParams &params = {});

   private:
    std::string conninfo_;
    std::unique_ptr<PGconn, decltype(&PQfinish)> conn_;
    log::Logger logger_;
  };

}  // namespace nineteen::storage
