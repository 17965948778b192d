/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispatch/messages.hpp"

#include "clock/clock.hpp"
#include "common/json.hpp"
#include "dispatch/dispatch_error.hpp"

namespace nineteen::dispatch {

  namespace {
    outcome::result<rapidjson::Document> parseObject(std::string_view message) {
      rapidjson::Document document;
      document.Parse(message.data(), message.size());
      if (document.HasParseError() or not document.IsObject()) {
        return DispatchError::MALFORMED_MESSAGE;
      }
      return document;
    }
  }  // namespace

  std::string encodeQueueEntry(const QueueEntry &entry) {
    rapidjson::Document document(rapidjson::kObjectType);
    auto &a = document.GetAllocator();
    document.AddMember("task_id", common::jsonString(entry.task_id, a), a);
    document.AddMember("task_type", common::jsonString(entry.task_type, a), a);
    document.AddMember(
        "kind", common::jsonString(primitives::toString(entry.kind), a), a);
    document.AddMember("deadline_ms", clock::toMillis(entry.deadline), a);
    return common::json2string(document);
  }

  outcome::result<QueueEntry> decodeQueueEntry(std::string_view message) {
    OUTCOME_TRY(document, parseObject(message));
    auto task_id = common::getString(document, "task_id");
    auto task_type = common::getString(document, "task_type");
    auto kind = common::getString(document, "kind");
    auto deadline = common::getInt64(document, "deadline_ms");
    if (not task_id or task_id->empty() or not task_type or not kind
        or not deadline) {
      return DispatchError::MALFORMED_MESSAGE;
    }
    auto parsed_kind = primitives::taskKindFromString(*kind);
    if (not parsed_kind) {
      return DispatchError::MALFORMED_MESSAGE;
    }
    return QueueEntry{
        .task_id = std::move(*task_id),
        .task_type = std::move(*task_type),
        .kind = *parsed_kind,
        .deadline = clock::fromMillis(*deadline),
    };
  }

  std::string encodeTaskResult(const primitives::TaskResult &result) {
    rapidjson::Document document(rapidjson::kObjectType);
    auto &a = document.GetAllocator();
    document.AddMember("task_id", common::jsonString(result.task_id, a), a);
    document.AddMember(
        "status", common::jsonString(primitives::toString(result.status), a), a);
    if (result.participant) {
      document.AddMember(
          "participant", common::jsonString(*result.participant, a), a);
    }
    document.AddMember(
        "latency_ms", static_cast<int64_t>(result.latency.count()), a);
    document.AddMember("quality", result.quality, a);
    document.AddMember("response", common::jsonString(result.response, a), a);
    return common::json2string(document);
  }

  outcome::result<primitives::TaskResult> decodeTaskResult(
      std::string_view message) {
    OUTCOME_TRY(document, parseObject(message));
    auto task_id = common::getString(document, "task_id");
    auto status = common::getString(document, "status");
    if (not task_id or not status) {
      return DispatchError::MALFORMED_MESSAGE;
    }
    auto parsed_status = primitives::taskStatusFromString(*status);
    if (not parsed_status) {
      return DispatchError::MALFORMED_MESSAGE;
    }
    return primitives::TaskResult{
        .task_id = std::move(*task_id),
        .status = *parsed_status,
        .participant = common::getString(document, "participant"),
        .latency = std::chrono::milliseconds{
            common::getInt64(document, "latency_ms").value_or(0)},
        .quality = common::getDouble(document, "quality").value_or(0.),
        .response = common::getString(document, "response").value_or(""),
    };
  }

}  // namespace nineteen::dispatch
