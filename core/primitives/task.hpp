/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "primitives/participant.hpp"

namespace nineteen::primitives {

  using TaskId = std::string;

  enum class TaskKind : uint8_t {
    Organic = 0,
    Synthetic = 1,
  };

  enum class TaskStatus : uint8_t {
    Pending = 0,
    Dispatched = 1,
    Completed = 2,
    Failed = 3,
    Expired = 4,
  };

  /// Completed, failed and expired tasks never change again
  inline bool isTerminal(TaskStatus status) {
    return status == TaskStatus::Completed or status == TaskStatus::Failed
        or status == TaskStatus::Expired;
  }

  std::string_view toString(TaskKind kind);
  std::string_view toString(TaskStatus status);
  std::optional<TaskKind> taskKindFromString(std::string_view str);
  std::optional<TaskStatus> taskStatusFromString(std::string_view str);

  /**
   * Unit of organic or synthetic work with a deadline
   */
  struct Task {
    TaskId id;
    TaskKind kind{TaskKind::Organic};

    /// Name of the configured task type, also the worker endpoint path
    std::string task_type;

    std::string payload;
    Timestamp submitted_at{};
    Timestamp deadline{};

    std::optional<Hotkey> assigned_participant;
    TaskStatus status{TaskStatus::Pending};

    /// Number of dispatch attempts made so far
    uint32_t attempts{};

    bool operator==(const Task &other) const = default;
  };

  /**
   * Final state of a task as broadcast to waiting gateways
   */
  struct TaskResult {
    TaskId task_id;
    TaskStatus status{TaskStatus::Pending};
    std::optional<Hotkey> participant;
    std::chrono::milliseconds latency{};
    double quality{};
    std::string response;

    bool operator==(const TaskResult &other) const = default;
  };

}  // namespace nineteen::primitives
