/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/postgres/pg_weight_submission_repository.hpp"

#include "common/json.hpp"

namespace nineteen::storage {

  namespace {
    constexpr std::string_view kUpsert = R"(
      INSERT INTO weight_submissions
        (epoch, weights, submitted_at, tx_ref, status, attempts)
      VALUES ($1::BIGINT, $2, $3::BIGINT, $4, $5::SMALLINT, $6::INTEGER)
      ON CONFLICT (epoch) DO UPDATE
      SET weights = EXCLUDED.weights,
          submitted_at = EXCLUDED.submitted_at,
          tx_ref = EXCLUDED.tx_ref,
          status = EXCLUDED.status,
          attempts = EXCLUDED.attempts
      WHERE weight_submissions.status <> 0)";

    constexpr std::string_view kSelect = R"(
      SELECT epoch, weights, submitted_at, tx_ref, status, attempts
      FROM weight_submissions WHERE epoch = $1::BIGINT)";

    std::string encodeWeights(
        const std::vector<primitives::WeightEntry> &weights) {
      rapidjson::Document document;
      document.SetArray();
      auto &allocator = document.GetAllocator();
      for (auto &entry : weights) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember(
            "node_id", static_cast<unsigned>(entry.node_id), allocator);
        item.AddMember(
            "hotkey", common::jsonString(entry.hotkey, allocator), allocator);
        item.AddMember("weight", entry.weight, allocator);
        document.PushBack(item, allocator);
      }
      return common::json2string(document);
    }

    outcome::result<std::vector<primitives::WeightEntry>> decodeWeights(
        std::string_view json) {
      rapidjson::Document document;
      document.Parse(json.data(), json.size());
      if (document.HasParseError() or not document.IsArray()) {
        return DatabaseError::UNEXPECTED_RESULT;
      }
      std::vector<primitives::WeightEntry> weights;
      weights.reserve(document.Size());
      for (auto &item : document.GetArray()) {
        auto node_id = common::getInt64(item, "node_id");
        auto hotkey = common::getString(item, "hotkey");
        auto weight = common::getDouble(item, "weight");
        if (not node_id or not hotkey or not weight) {
          return DatabaseError::UNEXPECTED_RESULT;
        }
        weights.push_back(
            {static_cast<primitives::NodeId>(*node_id), *hotkey, *weight});
      }
      return weights;
    }
  }  // namespace

  PgWeightSubmissionRepository::PgWeightSubmissionRepository(
      std::shared_ptr<PgConnectionPool> pool)
      : pool_{std::move(pool)},
        logger_{log::createLogger("WeightSubmissionRepository", "postgres")} {
    BOOST_ASSERT(pool_ != nullptr);
  }

  outcome::result<std::optional<primitives::WeightSubmission>>
  PgWeightSubmissionRepository::get(primitives::Epoch epoch) const {
    return pool_->withConnection(
        [&](PgConnection &connection)
            -> outcome::result<std::optional<primitives::WeightSubmission>> {
          OUTCOME_TRY(rows, connection.exec(kSelect, {std::to_string(epoch)}));
          if (rows.rows() == 0) {
            return std::optional<primitives::WeightSubmission>{};
          }
          primitives::WeightSubmission submission;
          submission.epoch = epoch;
          OUTCOME_TRY(weights, decodeWeights(rows.text(0, 1)));
          submission.weights = std::move(weights);
          OUTCOME_TRY(submitted_at, rows.integer(0, 2));
          submission.submitted_at = clock::fromMillis(submitted_at);
          submission.tx_ref = rows.optionalText(0, 3);
          OUTCOME_TRY(status, rows.integer(0, 4));
          submission.status = static_cast<primitives::SubmissionStatus>(status);
          OUTCOME_TRY(attempts, rows.integer(0, 5));
          submission.attempts = static_cast<uint32_t>(attempts);
          return std::make_optional(std::move(submission));
        });
  }

  outcome::result<bool> PgWeightSubmissionRepository::store(
      const primitives::WeightSubmission &submission) {
    return pool_->withConnection(
        [&](PgConnection &connection) -> outcome::result<bool> {
          OUTCOME_TRY(
              rows,
              connection.exec(
                  kUpsert,
                  {std::to_string(submission.epoch),
                   encodeWeights(submission.weights),
                   std::to_string(clock::toMillis(submission.submitted_at)),
                   submission.tx_ref,
                   std::to_string(static_cast<int>(submission.status)),
                   std::to_string(submission.attempts)}));
          auto stored = rows.affectedRows() == 1;
          if (not stored) {
            SL_DEBUG(logger_,
                     "Epoch {} already has a submitted weight vector",
                     submission.epoch);
          }
          return stored;
        });
  }

}  // namespace nineteen::storage
