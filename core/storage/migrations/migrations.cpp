/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/migrations/migrations.hpp"

#include "storage/database_error.hpp"

namespace nineteen::storage::migrations {

  namespace {
    constexpr std::string_view kCreateVersionTable = R"(
      CREATE TABLE IF NOT EXISTS schema_migrations (
        version INTEGER PRIMARY KEY,
        description TEXT NOT NULL,
        applied_at TIMESTAMPTZ NOT NULL DEFAULT now()
      ))";

    constexpr std::string_view kSelectVersion =
        "SELECT COALESCE(MAX(version), 0) FROM schema_migrations";

    constexpr std::string_view kTableExists =
        "SELECT to_regclass('schema_migrations') IS NOT NULL";

    // Arbitrary key shared by every migrator
    constexpr std::string_view kLock =
        "SELECT pg_advisory_xact_lock(1919191919)";

    constexpr std::string_view kRecord =
        "INSERT INTO schema_migrations (version, description) "
        "VALUES ($1::INTEGER, $2)";
  }  // namespace

  const std::vector<Migration> &allMigrations() {
    static const std::vector<Migration> migrations{
        {1,
         "participants",
         {R"(
            CREATE TABLE participants (
              hotkey TEXT PRIMARY KEY,
              coldkey TEXT NOT NULL,
              node_id INTEGER NOT NULL,
              netuid INTEGER NOT NULL,
              stake DOUBLE PRECISION NOT NULL,
              incentive DOUBLE PRECISION NOT NULL,
              trust DOUBLE PRECISION NOT NULL,
              vtrust DOUBLE PRECISION NOT NULL,
              registration_block BIGINT NOT NULL,
              ip TEXT NOT NULL,
              ip_type SMALLINT NOT NULL,
              port INTEGER NOT NULL,
              protocol SMALLINT NOT NULL,
              eligible BOOLEAN NOT NULL,
              last_updated BIGINT NOT NULL
            ))",
          R"(
            CREATE TABLE participants_history (
              LIKE participants,
              recorded_at BIGINT NOT NULL
            ))",
          "CREATE INDEX participants_history_recorded_at "
          "ON participants_history (recorded_at)"}},
        {2,
         "tasks and outcomes",
         {R"(
            CREATE TABLE tasks (
              id TEXT PRIMARY KEY,
              kind SMALLINT NOT NULL,
              task_type TEXT NOT NULL,
              payload TEXT NOT NULL,
              submitted_at BIGINT NOT NULL,
              deadline BIGINT NOT NULL,
              assigned_participant TEXT,
              status SMALLINT NOT NULL,
              attempts INTEGER NOT NULL DEFAULT 0
            ))",
          "CREATE INDEX tasks_status ON tasks (status)",
          R"(
            CREATE TABLE outcomes (
              task_id TEXT NOT NULL,
              hotkey TEXT NOT NULL,
              latency_ms BIGINT NOT NULL,
              success BOOLEAN NOT NULL,
              quality DOUBLE PRECISION NOT NULL,
              created_at BIGINT NOT NULL,
              PRIMARY KEY (task_id, hotkey)
            ))",
          "CREATE INDEX outcomes_created_at ON outcomes (created_at)"}},
        {3,
         "scores and weight submissions",
         {R"(
            CREATE TABLE scores (
              hotkey TEXT PRIMARY KEY,
              value DOUBLE PRECISION NOT NULL,
              samples INTEGER NOT NULL,
              computed_at BIGINT NOT NULL
            ))",
          R"(
            CREATE TABLE weight_submissions (
              epoch BIGINT PRIMARY KEY,
              weights TEXT NOT NULL,
              submitted_at BIGINT NOT NULL,
              tx_ref TEXT,
              status SMALLINT NOT NULL,
              attempts INTEGER NOT NULL
            ))"}},
    };
    return migrations;
  }

  Migrator::Migrator(std::shared_ptr<PgConnectionPool> pool)
      : pool_{std::move(pool)},
        logger_{log::createLogger("Migrator", "migrations")} {
    BOOST_ASSERT(pool_ != nullptr);
  }

  outcome::result<uint32_t> Migrator::currentVersion() const {
    return pool_->withConnection(
        [&](PgConnection &connection) -> outcome::result<uint32_t> {
          OUTCOME_TRY(exists, connection.exec(kTableExists));
          if (exists.rows() != 1 or not exists.boolean(0, 0)) {
            return 0u;
          }
          OUTCOME_TRY(rows, connection.exec(kSelectVersion));
          if (rows.rows() != 1) {
            return DatabaseError::UNEXPECTED_RESULT;
          }
          OUTCOME_TRY(version, rows.integer(0, 0));
          return static_cast<uint32_t>(version);
        });
  }

  outcome::result<uint32_t> Migrator::migrate() {
    uint32_t version = 0;
    for (auto &migration : allMigrations()) {
      auto applied = pool_->withTransaction(
          [&](PgConnection &connection) -> outcome::result<bool> {
            OUTCOME_TRY(connection.exec(kLock));
            OUTCOME_TRY(connection.exec(kCreateVersionTable));
            OUTCOME_TRY(rows, connection.exec(kSelectVersion));
            OUTCOME_TRY(current, rows.integer(0, 0));
            version = static_cast<uint32_t>(current);
            if (current >= migration.version) {
              return false;
            }
            if (current + 1 != migration.version) {
              SL_ERROR(logger_,
                       "Schema is at version {}, can not apply version {}",
                       current,
                       migration.version);
              return DatabaseError::MIGRATION_FAILED;
            }
            for (auto &statement : migration.statements) {
              OUTCOME_TRY(connection.exec(statement));
            }
            OUTCOME_TRY(
                connection.exec(kRecord,
                                {std::to_string(migration.version),
                                 std::string{migration.description}}));
            return true;
          });
      if (applied.has_error()) {
        SL_ERROR(logger_,
                 "Migration {} ({}) failed: {}",
                 migration.version,
                 migration.description,
                 applied.error().message());
        return DatabaseError::MIGRATION_FAILED;
      }
      if (applied.value()) {
        version = migration.version;
        SL_INFO(logger_,
                "Applied migration {}: {}",
                migration.version,
                migration.description);
      }
    }
    SL_INFO(logger_, "Schema is at version {}", version);
    return version;
  }

  outcome::result<void> Migrator::ensureVersion(uint32_t required) const {
    OUTCOME_TRY(version, currentVersion());
    if (version != required) {
      SL_CRITICAL(logger_,
                  "Schema version {} found, {} required. "
                  "Run `nineteen migrate` first",
                  version,
                  required);
      return DatabaseError::SCHEMA_MISMATCH;
    }
    return outcome::success();
  }

}  // namespace nineteen::storage::migrations
