/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/postgres/pg_score_repository.hpp"

#include <fmt/format.h>

namespace nineteen::storage {

  PgScoreRepository::PgScoreRepository(std::shared_ptr<PgConnectionPool> pool)
      : pool_{std::move(pool)} {
    BOOST_ASSERT(pool_ != nullptr);
  }

  outcome::result<void> PgScoreRepository::replaceAll(
      const std::vector<primitives::Score> &scores) {
    return pool_->withTransaction(
        [&](PgConnection &connection) -> outcome::result<void> {
          OUTCOME_TRY(connection.exec("DELETE FROM scores"));
          for (auto &score : scores) {
            OUTCOME_TRY(connection.exec(
                "INSERT INTO scores (hotkey, value, samples, computed_at) "
                "VALUES ($1, $2::DOUBLE PRECISION, $3::INTEGER, $4::BIGINT)",
                {score.hotkey,
                 fmt::format("{}", score.value),
                 std::to_string(score.samples),
                 std::to_string(clock::toMillis(score.computed_at))}));
          }
          return outcome::success();
        });
  }

  outcome::result<std::vector<primitives::Score>> PgScoreRepository::getAll()
      const {
    return pool_->withConnection(
        [&](PgConnection &connection)
            -> outcome::result<std::vector<primitives::Score>> {
          OUTCOME_TRY(rows,
                      connection.exec("SELECT hotkey, value, samples, "
                                      "computed_at FROM scores "
                                      "ORDER BY hotkey"));
          std::vector<primitives::Score> scores;
          scores.reserve(rows.rows());
          for (int i = 0; i < rows.rows(); ++i) {
            primitives::Score score;
            score.hotkey = rows.text(i, 0);
            OUTCOME_TRY(value, rows.real(i, 1));
            score.value = value;
            OUTCOME_TRY(samples, rows.integer(i, 2));
            score.samples = static_cast<uint32_t>(samples);
            OUTCOME_TRY(computed_at, rows.integer(i, 3));
            score.computed_at = clock::fromMillis(computed_at);
            scores.emplace_back(std::move(score));
          }
          return scores;
        });
  }

}  // namespace nineteen::storage
