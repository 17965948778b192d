/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/postgres/pg_task_repository.hpp"

#include <fmt/format.h>

namespace nineteen::storage {

  namespace {
    constexpr std::string_view kColumns =
        "id, kind, task_type, payload, submitted_at, deadline, "
        "assigned_participant, status, attempts";

    constexpr std::string_view kInsert = R"(
      INSERT INTO tasks
        (id, kind, task_type, payload, submitted_at, deadline,
         assigned_participant, status, attempts)
      VALUES ($1, $2::SMALLINT, $3, $4, $5::BIGINT, $6::BIGINT, $7,
              $8::SMALLINT, $9::INTEGER))";

    // Terminal tasks are never touched again
    constexpr std::string_view kCompareAndSet = R"(
      UPDATE tasks
      SET status = $2::SMALLINT, assigned_participant = $3,
          attempts = $4::INTEGER
      WHERE id = $1 AND status = $5::SMALLINT AND status IN (0, 1))";

    constexpr std::string_view kRemove =
        "DELETE FROM tasks WHERE id = $1 AND status = 0";

    std::string toParam(primitives::TaskStatus status) {
      return std::to_string(static_cast<int>(status));
    }

    outcome::result<primitives::Task> readTask(const PgResult &rows, int i) {
      primitives::Task task;
      task.id = rows.text(i, 0);
      OUTCOME_TRY(kind, rows.integer(i, 1));
      task.kind = static_cast<primitives::TaskKind>(kind);
      task.task_type = rows.text(i, 2);
      task.payload = rows.text(i, 3);
      OUTCOME_TRY(submitted_at, rows.integer(i, 4));
      task.submitted_at = clock::fromMillis(submitted_at);
      OUTCOME_TRY(deadline, rows.integer(i, 5));
      task.deadline = clock::fromMillis(deadline);
      task.assigned_participant = rows.optionalText(i, 6);
      OUTCOME_TRY(status, rows.integer(i, 7));
      if (status < 0 or status > 4) {
        return DatabaseError::UNEXPECTED_RESULT;
      }
      task.status = static_cast<primitives::TaskStatus>(status);
      OUTCOME_TRY(attempts, rows.integer(i, 8));
      task.attempts = static_cast<uint32_t>(attempts);
      return task;
    }
  }  // namespace

  PgTaskRepository::PgTaskRepository(std::shared_ptr<PgConnectionPool> pool)
      : pool_{std::move(pool)},
        logger_{log::createLogger("TaskRepository", "postgres")} {
    BOOST_ASSERT(pool_ != nullptr);
  }

  outcome::result<void> PgTaskRepository::insert(
      const primitives::Task &task) {
    return pool_->withConnection(
        [&](PgConnection &connection) -> outcome::result<void> {
          OUTCOME_TRY(connection.exec(
              kInsert,
              {task.id,
               std::to_string(static_cast<int>(task.kind)),
               task.task_type,
               task.payload,
               std::to_string(clock::toMillis(task.submitted_at)),
               std::to_string(clock::toMillis(task.deadline)),
               task.assigned_participant,
               toParam(task.status),
               std::to_string(task.attempts)}));
          return outcome::success();
        });
  }

  outcome::result<std::optional<primitives::Task>> PgTaskRepository::get(
      const primitives::TaskId &id) const {
    return pool_->withConnection(
        [&](PgConnection &connection)
            -> outcome::result<std::optional<primitives::Task>> {
          OUTCOME_TRY(rows,
                      connection.exec(fmt::format(
                                          "SELECT {} FROM tasks WHERE id = $1",
                                          kColumns),
                                      {id}));
          if (rows.rows() == 0) {
            return std::optional<primitives::Task>{};
          }
          OUTCOME_TRY(task, readTask(rows, 0));
          return std::make_optional(std::move(task));
        });
  }

  outcome::result<bool> PgTaskRepository::update(
      const primitives::Task &task, primitives::TaskStatus expected) {
    return pool_->withConnection(
        [&](PgConnection &connection) -> outcome::result<bool> {
          OUTCOME_TRY(rows,
                      connection.exec(kCompareAndSet,
                                      {task.id,
                                       toParam(task.status),
                                       task.assigned_participant,
                                       std::to_string(task.attempts),
                                       toParam(expected)}));
          auto updated = rows.affectedRows() == 1;
          if (not updated) {
            SL_DEBUG(logger_,
                     "Task {} is no longer {}, update to {} skipped",
                     task.id,
                     primitives::toString(expected),
                     primitives::toString(task.status));
          }
          return updated;
        });
  }

  outcome::result<void> PgTaskRepository::remove(
      const primitives::TaskId &id) {
    return pool_->withConnection(
        [&](PgConnection &connection) -> outcome::result<void> {
          OUTCOME_TRY(connection.exec(kRemove, {id}));
          return outcome::success();
        });
  }

  outcome::result<std::vector<primitives::Task>>
  PgTaskRepository::getNonTerminal() const {
    return pool_->withConnection(
        [&](PgConnection &connection)
            -> outcome::result<std::vector<primitives::Task>> {
          OUTCOME_TRY(
              rows,
              connection.exec(fmt::format("SELECT {} FROM tasks "
                                          "WHERE status IN (0, 1) "
                                          "ORDER BY submitted_at",
                                          kColumns)));
          std::vector<primitives::Task> tasks;
          tasks.reserve(rows.rows());
          for (int i = 0; i < rows.rows(); ++i) {
            OUTCOME_TRY(task, readTask(rows, i));
            tasks.emplace_back(std::move(task));
          }
          return tasks;
        });
  }

}  // namespace nineteen::storage
