/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "outcome/outcome.hpp"
#include "primitives/task.hpp"

namespace nineteen::dispatch {

  /// Element of the shared task queue, the task itself lives in the store
  struct QueueEntry {
    primitives::TaskId task_id;
    std::string task_type;
    primitives::TaskKind kind{primitives::TaskKind::Organic};
    /// Caps the first lease taken on the task
    primitives::Timestamp deadline{};

    bool operator==(const QueueEntry &other) const = default;
  };

  std::string encodeQueueEntry(const QueueEntry &entry);

  /// @return DispatchError::MALFORMED_MESSAGE on bad input
  outcome::result<QueueEntry> decodeQueueEntry(std::string_view message);

  /// Message broadcast on the task results channel
  std::string encodeTaskResult(const primitives::TaskResult &result);

  outcome::result<primitives::TaskResult> decodeTaskResult(
      std::string_view message);

}  // namespace nineteen::dispatch
