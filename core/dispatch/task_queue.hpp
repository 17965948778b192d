/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "cache/coordination_cache.hpp"
#include "clock/clock.hpp"
#include "dispatch/messages.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "storage/task_repository.hpp"

namespace nineteen::dispatch {

  struct QueueConfig {
    /// Max number of queued entries shared by all producers
    size_t capacity{10000};
  };

  /**
   * Bounded queue of tasks awaiting dispatch. A task is written to the store
   * before its entry is appended to the shared list in the cache.
   */
  class TaskQueue {
   public:
    TaskQueue(QueueConfig config,
              std::shared_ptr<storage::TaskRepository> tasks,
              std::shared_ptr<cache::CoordinationCache> cache,
              std::shared_ptr<clock::SystemClock> clock);

    /**
     * Stores \param task as pending and queues it
     * @return queue length after the append,
     * DispatchError::INVALID_TASK for an overdue or empty task,
     * DispatchError::QUEUE_FULL if the queue is at capacity, in which case
     * the task is not stored either
     */
    outcome::result<size_t> enqueue(primitives::Task task);

    /// Queues an already stored task once more
    outcome::result<void> requeue(const primitives::Task &task);

    /**
     * Takes the head of the queue, waiting up to \param timeout
     * @return nullopt when nothing arrived; malformed entries are dropped
     */
    outcome::result<std::optional<QueueEntry>> next(
        std::chrono::milliseconds timeout);

    outcome::result<size_t> length();

    /// Removes queued synthetic entries of \param task_type and expires
    /// their tasks
    outcome::result<size_t> clearSynthetic(std::string_view task_type);

   private:
    outcome::result<void> expireUnqueued(const primitives::TaskId &task_id);

    QueueConfig config_;
    std::shared_ptr<storage::TaskRepository> tasks_;
    std::shared_ptr<cache::CoordinationCache> cache_;
    std::shared_ptr<clock::SystemClock> clock_;
    log::Logger logger_;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();
    metrics::Gauge *metric_queue_length_;
    metrics::Counter *metric_rejected_;
  };

}  // namespace nineteen::dispatch
