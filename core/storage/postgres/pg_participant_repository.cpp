/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/postgres/pg_participant_repository.hpp"

#include <fmt/format.h>

namespace nineteen::storage {

  namespace {
    constexpr std::string_view kSelectAll = R"(
      SELECT hotkey, coldkey, node_id, netuid, stake, incentive, trust,
             vtrust, registration_block, ip, ip_type, port, protocol,
             eligible, last_updated
      FROM participants
      ORDER BY node_id)";

    constexpr std::string_view kMoveToHistory = R"(
      INSERT INTO participants_history
      SELECT *, $1::BIGINT FROM participants)";

    constexpr std::string_view kDeleteAll = "DELETE FROM participants";

    constexpr std::string_view kInsert = R"(
      INSERT INTO participants
        (hotkey, coldkey, node_id, netuid, stake, incentive, trust, vtrust,
         registration_block, ip, ip_type, port, protocol, eligible,
         last_updated)
      VALUES ($1, $2, $3::INTEGER, $4::INTEGER, $5::DOUBLE PRECISION,
              $6::DOUBLE PRECISION, $7::DOUBLE PRECISION,
              $8::DOUBLE PRECISION, $9::BIGINT, $10, $11::SMALLINT,
              $12::INTEGER, $13::SMALLINT, $14::BOOLEAN, $15::BIGINT))";
  }  // namespace

  PgParticipantRepository::PgParticipantRepository(
      std::shared_ptr<PgConnectionPool> pool)
      : pool_{std::move(pool)},
        logger_{log::createLogger("ParticipantRepository", "postgres")} {
    BOOST_ASSERT(pool_ != nullptr);
  }

  outcome::result<void> PgParticipantRepository::replaceAll(
      const std::vector<primitives::Participant> &participants,
      primitives::Timestamp now) {
    return pool_->withTransaction(
        [&](PgConnection &connection) -> outcome::result<void> {
          OUTCOME_TRY(connection.exec(
              kMoveToHistory, {std::to_string(clock::toMillis(now))}));
          OUTCOME_TRY(connection.exec(kDeleteAll));
          for (auto &p : participants) {
            OUTCOME_TRY(connection.exec(
                kInsert,
                {p.hotkey,
                 p.coldkey,
                 std::to_string(p.node_id),
                 std::to_string(p.netuid),
                 fmt::format("{}", p.stake),
                 fmt::format("{}", p.incentive),
                 fmt::format("{}", p.trust),
                 fmt::format("{}", p.vtrust),
                 std::to_string(p.registration_block),
                 p.ip,
                 std::to_string(p.ip_type),
                 std::to_string(p.port),
                 std::to_string(p.protocol),
                 p.eligible ? "true" : "false",
                 std::to_string(clock::toMillis(p.last_updated))}));
          }
          SL_DEBUG(logger_, "Stored {} participants", participants.size());
          return outcome::success();
        });
  }

  outcome::result<std::vector<primitives::Participant>>
  PgParticipantRepository::getAll() const {
    return pool_->withConnection(
        [&](PgConnection &connection)
            -> outcome::result<std::vector<primitives::Participant>> {
          OUTCOME_TRY(rows, connection.exec(kSelectAll));
          std::vector<primitives::Participant> participants;
          participants.reserve(rows.rows());
          for (int i = 0; i < rows.rows(); ++i) {
            primitives::Participant p;
            p.hotkey = rows.text(i, 0);
            p.coldkey = rows.text(i, 1);
            OUTCOME_TRY(node_id, rows.integer(i, 2));
            p.node_id = static_cast<primitives::NodeId>(node_id);
            OUTCOME_TRY(netuid, rows.integer(i, 3));
            p.netuid = static_cast<uint16_t>(netuid);
            OUTCOME_TRY(stake, rows.real(i, 4));
            p.stake = stake;
            OUTCOME_TRY(incentive, rows.real(i, 5));
            p.incentive = incentive;
            OUTCOME_TRY(trust, rows.real(i, 6));
            p.trust = trust;
            OUTCOME_TRY(vtrust, rows.real(i, 7));
            p.vtrust = vtrust;
            OUTCOME_TRY(block, rows.integer(i, 8));
            p.registration_block = static_cast<uint64_t>(block);
            p.ip = rows.text(i, 9);
            OUTCOME_TRY(ip_type, rows.integer(i, 10));
            p.ip_type = static_cast<uint8_t>(ip_type);
            OUTCOME_TRY(port, rows.integer(i, 11));
            p.port = static_cast<uint16_t>(port);
            OUTCOME_TRY(protocol, rows.integer(i, 12));
            p.protocol = static_cast<uint8_t>(protocol);
            p.eligible = rows.boolean(i, 13);
            OUTCOME_TRY(last_updated, rows.integer(i, 14));
            p.last_updated = clock::fromMillis(last_updated);
            participants.emplace_back(std::move(p));
          }
          return participants;
        });
  }

}  // namespace nineteen::storage
