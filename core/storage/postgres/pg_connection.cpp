/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/postgres/pg_connection.hpp"

#include <charconv>
#include <cstdlib>

#include "storage/database_error.hpp"

namespace nineteen::storage {

  namespace {
    constexpr std::string_view kUniqueViolation = "23505";
  }

  PgResult::PgResult(PGresult *result) : result_{result, &PQclear} {}

  ExecStatusType PgResult::status() const {
    return result_ ? PQresultStatus(result_.get()) : PGRES_FATAL_ERROR;
  }

  std::string_view PgResult::sqlState() const {
    if (not result_) {
      return {};
    }
    const char *state = PQresultErrorField(result_.get(), PG_DIAG_SQLSTATE);
    return state != nullptr ? std::string_view(state) : std::string_view{};
  }

  std::string_view PgResult::errorMessage() const {
    return result_ ? PQresultErrorMessage(result_.get()) : "out of memory";
  }

  int PgResult::rows() const {
    return PQntuples(result_.get());
  }

  uint64_t PgResult::affectedRows() const {
    std::string_view tuples = PQcmdTuples(result_.get());
    uint64_t count = 0;
    std::from_chars(tuples.data(), tuples.data() + tuples.size(), count);
    return count;
  }

  bool PgResult::isNull(int row, int column) const {
    return PQgetisnull(result_.get(), row, column) == 1;
  }

  std::string_view PgResult::text(int row, int column) const {
    return {PQgetvalue(result_.get(), row, column),
            static_cast<size_t>(PQgetlength(result_.get(), row, column))};
  }

  std::optional<std::string> PgResult::optionalText(int row,
                                                    int column) const {
    if (isNull(row, column)) {
      return std::nullopt;
    }
    return std::string(text(row, column));
  }

  outcome::result<int64_t> PgResult::integer(int row, int column) const {
    auto value = text(row, column);
    int64_t number = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), number);
    if (ec != std::errc{} or ptr != value.data() + value.size()) {
      return DatabaseError::UNEXPECTED_RESULT;
    }
    return number;
  }

  outcome::result<double> PgResult::real(int row, int column) const {
    std::string value(text(row, column));
    char *end = nullptr;
    double number = std::strtod(value.c_str(), &end);
    if (value.empty() or end != value.c_str() + value.size()) {
      return DatabaseError::UNEXPECTED_RESULT;
    }
    return number;
  }

  bool PgResult::boolean(int row, int column) const {
    return text(row, column) == "t";
  }

  PgConnection::PgConnection(std::string conninfo)
      : conninfo_{std::move(conninfo)},
        conn_{nullptr, &PQfinish},
        logger_{log::createLogger("PgConnection", "postgres")} {}

  outcome::result<void> PgConnection::connect() {
    conn_.reset(PQconnectdb(conninfo_.c_str()));
    if (conn_ == nullptr or PQstatus(conn_.get()) != CONNECTION_OK) {
      SL_WARN(logger_,
              "Can't connect to database: {}",
              conn_ ? PQerrorMessage(conn_.get()) : "out of memory");
      conn_.reset();
      return DatabaseError::CONNECTION_FAILED;
    }
    SL_DEBUG(logger_, "Connected to database");
    return outcome::success();
  }

  bool PgConnection::isConnected() const {
    return conn_ != nullptr and PQstatus(conn_.get()) == CONNECTION_OK;
  }

  outcome::result<PgResult> PgConnection::exec(std::string_view sql,
                                               const PgParams &params) {
    if (not isConnected()) {
      OUTCOME_TRY(connect());
    }

    std::vector<const char *> values;
    values.reserve(params.size());
    for (auto &param : params) {
      values.push_back(param ? param->c_str() : nullptr);
    }

    std::string query(sql);
    PgResult result(PQexecParams(conn_.get(),
                                 query.c_str(),
                                 static_cast<int>(values.size()),
                                 nullptr,
                                 values.data(),
                                 nullptr,
                                 nullptr,
                                 0));

    auto status = result.status();
    if (status == PGRES_COMMAND_OK or status == PGRES_TUPLES_OK) {
      return result;
    }

    if (not isConnected()) {
      SL_WARN(logger_, "Connection lost: {}", PQerrorMessage(conn_.get()));
      conn_.reset();
      return DatabaseError::CONNECTION_FAILED;
    }
    if (result.sqlState() == kUniqueViolation) {
      return DatabaseError::DUPLICATE_KEY;
    }
    SL_ERROR(logger_, "Query failed: {}", result.errorMessage());
    return DatabaseError::QUERY_FAILED;
  }

}  // namespace nineteen::storage
