/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/task.hpp"

namespace nineteen::primitives {

  std::string_view toString(TaskKind kind) {
    switch (kind) {
      case TaskKind::Organic:
        return "organic";
      case TaskKind::Synthetic:
        return "synthetic";
    }
    return "unknown";
  }

  std::string_view toString(TaskStatus status) {
    switch (status) {
      case TaskStatus::Pending:
        return "pending";
      case TaskStatus::Dispatched:
        return "dispatched";
      case TaskStatus::Completed:
        return "completed";
      case TaskStatus::Failed:
        return "failed";
      case TaskStatus::Expired:
        return "expired";
    }
    return "unknown";
  }

  std::optional<TaskKind> taskKindFromString(std::string_view str) {
    if (str == "organic") {
      return TaskKind::Organic;
    }
    if (str == "synthetic") {
      return TaskKind::Synthetic;
    }
    return std::nullopt;
  }

  std::optional<TaskStatus> taskStatusFromString(std::string_view str) {
    for (auto status : {TaskStatus::Pending,
                        TaskStatus::Dispatched,
                        TaskStatus::Completed,
                        TaskStatus::Failed,
                        TaskStatus::Expired}) {
      if (toString(status) == str) {
        return status;
      }
    }
    return std::nullopt;
  }

}  // namespace nineteen::primitives
