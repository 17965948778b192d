/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/postgres/pg_outcome_repository.hpp"

#include <fmt/format.h>

namespace nineteen::storage {

  namespace {
    constexpr std::string_view kInsert = R"(
      INSERT INTO outcomes
        (task_id, hotkey, latency_ms, success, quality, created_at)
      VALUES ($1, $2, $3::BIGINT, $4::BOOLEAN, $5::DOUBLE PRECISION,
              $6::BIGINT)
      ON CONFLICT (task_id, hotkey) DO NOTHING)";
  }  // namespace

  PgOutcomeRepository::PgOutcomeRepository(
      std::shared_ptr<PgConnectionPool> pool)
      : pool_{std::move(pool)} {
    BOOST_ASSERT(pool_ != nullptr);
  }

  outcome::result<bool> PgOutcomeRepository::insert(
      const primitives::TaskOutcome &outcome) {
    return pool_->withConnection(
        [&](PgConnection &connection) -> outcome::result<bool> {
          OUTCOME_TRY(
              rows,
              connection.exec(kInsert,
                              {outcome.task_id,
                               outcome.hotkey,
                               std::to_string(outcome.latency.count()),
                               outcome.success ? "true" : "false",
                               fmt::format("{}", outcome.quality),
                               std::to_string(
                                   clock::toMillis(outcome.timestamp))}));
          return rows.affectedRows() == 1;
        });
  }

  outcome::result<std::vector<primitives::TaskOutcome>>
  PgOutcomeRepository::getSince(primitives::Timestamp since) const {
    return select("created_at >= $1::BIGINT",
                  {std::to_string(clock::toMillis(since))});
  }

  outcome::result<std::vector<primitives::TaskOutcome>>
  PgOutcomeRepository::getForTask(const primitives::TaskId &task_id) const {
    return select("task_id = $1", {task_id});
  }

  outcome::result<std::vector<primitives::TaskOutcome>>
  PgOutcomeRepository::select(std::string_view condition,
                              const PgParams &params) const {
    auto sql = fmt::format(
        "SELECT task_id, hotkey, latency_ms, success, quality, created_at "
        "FROM outcomes WHERE {}",
        condition);
    return pool_->withConnection(
        [&](PgConnection &connection)
            -> outcome::result<std::vector<primitives::TaskOutcome>> {
          OUTCOME_TRY(rows, connection.exec(sql, params));
          std::vector<primitives::TaskOutcome> outcomes;
          outcomes.reserve(rows.rows());
          for (int i = 0; i < rows.rows(); ++i) {
            primitives::TaskOutcome outcome;
            outcome.task_id = rows.text(i, 0);
            outcome.hotkey = rows.text(i, 1);
            OUTCOME_TRY(latency, rows.integer(i, 2));
            outcome.latency = std::chrono::milliseconds{latency};
            outcome.success = rows.boolean(i, 3);
            OUTCOME_TRY(quality, rows.real(i, 4));
            outcome.quality = quality;
            OUTCOME_TRY(created_at, rows.integer(i, 5));
            outcome.timestamp = clock::fromMillis(created_at);
            outcomes.emplace_back(std::move(outcome));
          }
          return outcomes;
        });
  }

}  // namespace nineteen::storage
