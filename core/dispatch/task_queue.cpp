/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispatch/task_queue.hpp"

#include <boost/assert.hpp>

#include "cache/cache_error.hpp"
#include "cache/cache_keys.hpp"
#include "dispatch/dispatch_error.hpp"

namespace nineteen::dispatch {

  namespace {
    constexpr auto kQueueLengthMetric = "nineteen_dispatch_queue_length";
    constexpr auto kRejectedMetric = "nineteen_dispatch_queue_rejected_total";

    QueueEntry entryOf(const primitives::Task &task) {
      return QueueEntry{
          .task_id = task.id,
          .task_type = task.task_type,
          .kind = task.kind,
          .deadline = task.deadline,
      };
    }
  }  // namespace

  TaskQueue::TaskQueue(QueueConfig config,
                       std::shared_ptr<storage::TaskRepository> tasks,
                       std::shared_ptr<cache::CoordinationCache> cache,
                       std::shared_ptr<clock::SystemClock> clock)
      : config_{config},
        tasks_{std::move(tasks)},
        cache_{std::move(cache)},
        clock_{std::move(clock)},
        logger_{log::createLogger("TaskQueue", "dispatch")} {
    BOOST_ASSERT(tasks_ != nullptr);
    BOOST_ASSERT(cache_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);

    metrics_registry_->registerGaugeFamily(kQueueLengthMetric,
                                           "Entries in the task queue");
    metric_queue_length_ =
        metrics_registry_->registerGaugeMetric(kQueueLengthMetric);
    metrics_registry_->registerCounterFamily(
        kRejectedMetric, "Tasks rejected because the queue was full");
    metric_rejected_ = metrics_registry_->registerCounterMetric(kRejectedMetric);
  }

  outcome::result<size_t> TaskQueue::enqueue(primitives::Task task) {
    auto now = clock_->now();
    if (task.id.empty() or task.payload.empty() or task.task_type.empty()
        or task.deadline <= now) {
      return DispatchError::INVALID_TASK;
    }
    task.status = primitives::TaskStatus::Pending;
    task.assigned_participant.reset();
    task.attempts = 0;
    if (task.submitted_at == primitives::Timestamp{}) {
      task.submitted_at = now;
    }

    OUTCOME_TRY(tasks_->insert(task));

    auto pushed = cache_->pushBackBounded(
        cache::keys::kQueryQueue, encodeQueueEntry(entryOf(task)),
        config_.capacity);
    if (pushed.has_value()) {
      metric_queue_length_->set(static_cast<double>(pushed.value()));
      SL_TRACE(logger_,
               "Queued {} task {} of type {}",
               primitives::toString(task.kind),
               task.id,
               task.task_type);
      return pushed.value();
    }

    // The task must not outlive its queue entry
    if (auto removed = tasks_->remove(task.id); removed.has_error()) {
      SL_ERROR(logger_,
               "Can't remove unqueued task {}: {}",
               task.id,
               removed.error().message());
    }
    if (pushed.error() == cache::CacheError::LIST_FULL) {
      metric_rejected_->inc();
      return DispatchError::QUEUE_FULL;
    }
    return pushed.as_failure();
  }

  outcome::result<void> TaskQueue::requeue(const primitives::Task &task) {
    OUTCOME_TRY(length,
                cache_->pushBack(cache::keys::kQueryQueue,
                                 encodeQueueEntry(entryOf(task))));
    metric_queue_length_->set(static_cast<double>(length));
    return outcome::success();
  }

  outcome::result<std::optional<QueueEntry>> TaskQueue::next(
      std::chrono::milliseconds timeout) {
    OUTCOME_TRY(message, cache_->popFront(cache::keys::kQueryQueue, timeout));
    if (not message) {
      return std::optional<QueueEntry>{};
    }
    auto entry = decodeQueueEntry(*message);
    if (entry.has_error()) {
      SL_WARN(logger_, "Dropped malformed queue entry: {}", *message);
      return std::optional<QueueEntry>{};
    }
    return std::optional<QueueEntry>{std::move(entry.value())};
  }

  outcome::result<size_t> TaskQueue::length() {
    OUTCOME_TRY(length, cache_->length(cache::keys::kQueryQueue));
    metric_queue_length_->set(static_cast<double>(length));
    return length;
  }

  outcome::result<void> TaskQueue::expireUnqueued(
      const primitives::TaskId &task_id) {
    OUTCOME_TRY(task, tasks_->get(task_id));
    if (not task or task->status != primitives::TaskStatus::Pending) {
      return outcome::success();
    }
    task->status = primitives::TaskStatus::Expired;
    OUTCOME_TRY(tasks_->update(*task, primitives::TaskStatus::Pending));
    return outcome::success();
  }

  outcome::result<size_t> TaskQueue::clearSynthetic(
      std::string_view task_type) {
    OUTCOME_TRY(entries, cache_->listRange(cache::keys::kQueryQueue));
    size_t removed = 0;
    for (auto &message : entries) {
      auto entry = decodeQueueEntry(message);
      if (entry.has_error()
          or (entry.value().kind == primitives::TaskKind::Synthetic
              and entry.value().task_type == task_type)) {
        OUTCOME_TRY(count,
                    cache_->removeFromList(cache::keys::kQueryQueue, message));
        removed += count;
        if (entry.has_value()) {
          OUTCOME_TRY(expireUnqueued(entry.value().task_id));
        }
      }
    }
    if (removed != 0) {
      SL_DEBUG(logger_,
               "Removed {} stale synthetic entries of {}",
               removed,
               task_type);
    }
    return removed;
  }

}  // namespace nineteen::dispatch
