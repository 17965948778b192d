/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispatch/dispatch_router.hpp"

#include <algorithm>
#include <set>

#include <boost/assert.hpp>

#include "cache/cache_keys.hpp"
#include "metrics/metrics.hpp"

namespace nineteen::dispatch {

  namespace {
    constexpr auto kTasksMetric = "nineteen_dispatch_tasks_total";
    constexpr auto kAttemptFailuresMetric =
        "nineteen_dispatch_attempt_failures_total";
    constexpr auto kLatencyMetric = "nineteen_dispatch_latency_seconds";

    constexpr std::chrono::milliseconds kMaintenancePeriod{100};
    // Lease on an overdue task, long enough to mark it expired
    constexpr std::chrono::milliseconds kOverdueLeaseTtl{1000};

    std::chrono::milliseconds remainingUntil(primitives::Timestamp deadline,
                                             primitives::Timestamp now) {
      if (deadline <= now) {
        return std::chrono::milliseconds::zero();
      }
      return std::chrono::duration_cast<std::chrono::milliseconds>(deadline
                                                                   - now);
    }
  }  // namespace

  std::string_view toString(ProcessResult result) {
    switch (result) {
      case ProcessResult::Idle:
        return "idle";
      case ProcessResult::Skipped:
        return "skipped";
      case ProcessResult::Completed:
        return "completed";
      case ProcessResult::Failed:
        return "failed";
      case ProcessResult::Expired:
        return "expired";
      case ProcessResult::Deferred:
        return "deferred";
    }
    return "unknown";
  }

  double responseQuality(std::chrono::milliseconds latency,
                         std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
      return 0.5;
    }
    auto ratio = static_cast<double>(latency.count())
               / static_cast<double>(timeout.count());
    return 1. - 0.5 * std::clamp(ratio, 0., 1.);
  }

  DispatchRouter::DispatchRouter(
      application::AppStateManager &app_state_manager,
      RouterConfig config,
      std::shared_ptr<TaskQueue> queue,
      std::shared_ptr<storage::TaskRepository> tasks,
      std::shared_ptr<storage::ParticipantRepository> participants,
      std::shared_ptr<storage::ScoreRepository> scores,
      std::shared_ptr<scoring::ScoringEngine> scoring,
      std::shared_ptr<WorkerClient> worker_client,
      std::shared_ptr<cache::CoordinationCache> cache,
      std::shared_ptr<cache::LeaseManager> leases,
      std::shared_ptr<clock::SystemClock> clock,
      std::shared_ptr<ParticipantSelector> selector)
      : config_{config},
        queue_{std::move(queue)},
        tasks_{std::move(tasks)},
        participants_{std::move(participants)},
        scores_{std::move(scores)},
        scoring_{std::move(scoring)},
        worker_client_{std::move(worker_client)},
        cache_{std::move(cache)},
        leases_{std::move(leases)},
        clock_{std::move(clock)},
        selector_{std::move(selector)},
        logger_{log::createLogger("DispatchRouter", "dispatch")} {
    BOOST_ASSERT(queue_ != nullptr);
    BOOST_ASSERT(tasks_ != nullptr);
    BOOST_ASSERT(participants_ != nullptr);
    BOOST_ASSERT(scores_ != nullptr);
    BOOST_ASSERT(scoring_ != nullptr);
    BOOST_ASSERT(worker_client_ != nullptr);
    BOOST_ASSERT(cache_ != nullptr);
    BOOST_ASSERT(leases_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
    BOOST_ASSERT(selector_ != nullptr);

    metrics_registry_->registerCounterFamily(kTasksMetric,
                                             "Tasks by final status");
    metric_completed_ = metrics_registry_->registerCounterMetric(
        kTasksMetric, {{"status", "completed"}});
    metric_failed_ = metrics_registry_->registerCounterMetric(
        kTasksMetric, {{"status", "failed"}});
    metric_expired_ = metrics_registry_->registerCounterMetric(
        kTasksMetric, {{"status", "expired"}});
    metrics_registry_->registerCounterFamily(
        kAttemptFailuresMetric, "Dispatch attempts without a usable answer");
    metric_attempt_failures_ =
        metrics_registry_->registerCounterMetric(kAttemptFailuresMetric);
    metrics_registry_->registerHistogramFamily(kLatencyMetric,
                                               "Worker response time");
    metric_latency_ = metrics_registry_->registerHistogramMetric(
        kLatencyMetric, metrics::exponentialBuckets(0.05, 2., 10));

    app_state_manager.takeControl(*this);
  }

  bool DispatchRouter::prepare() {
    auto subscribed = cache_->subscribe(
        cache::keys::kEligibilityChangedChannel,
        [this](const std::string &) { refresh_requested_ = true; });
    if (subscribed.has_error()) {
      SL_ERROR(logger_,
               "Can't subscribe to eligibility changes: {}",
               subscribed.error().message());
      return false;
    }
    if (auto res = refreshParticipants(); res.has_error()) {
      SL_ERROR(logger_,
               "Can't load participants: {}",
               res.error().message());
      return false;
    }
    return true;
  }

  bool DispatchRouter::start() {
    stop_signal_.reset();
    if (auto res = recoverPending(); res.has_error()) {
      // Retried by the maintenance loop
      SL_WARN(logger_,
              "Can't recover unfinished tasks: {}",
              res.error().message());
    }

    thread_pool_ = std::make_unique<ThreadPool>("dispatch", config_.workers + 1);
    for (size_t i = 0; i < config_.workers; ++i) {
      thread_pool_->post([this] { workerLoop(); });
    }
    thread_pool_->post([this] { maintenanceLoop(); });
    SL_INFO(logger_, "Dispatching with {} workers", config_.workers);
    return true;
  }

  void DispatchRouter::stop() {
    stop_signal_.stop();
    if (thread_pool_) {
      thread_pool_->stop();
      thread_pool_.reset();
    }
  }

  void DispatchRouter::workerLoop() {
    while (not stop_signal_.stopped()) {
      auto res = processNext(config_.pop_timeout);
      if (res.has_error()) {
        SL_WARN(logger_, "Dispatch step failed: {}", res.error().message());
        if (stop_signal_.waitFor(config_.backoff.base)) {
          break;
        }
        continue;
      }
      if (res.value() != ProcessResult::Idle) {
        SL_TRACE(logger_, "Queue entry {}", toString(res.value()));
      }
    }
  }

  void DispatchRouter::maintenanceLoop() {
    auto next_refresh = clock_->now() + config_.participant_refresh_interval;
    auto next_recovery = clock_->now() + config_.recovery_interval;
    while (not stop_signal_.waitFor(kMaintenancePeriod)) {
      auto now = clock_->now();
      if (refresh_requested_.exchange(false) or now >= next_refresh) {
        next_refresh = now + config_.participant_refresh_interval;
        if (auto res = refreshParticipants(); res.has_error()) {
          SL_WARN(logger_,
                  "Can't refresh participants: {}",
                  res.error().message());
        }
      }
      if (now >= next_recovery) {
        next_recovery = now + config_.recovery_interval;
        if (auto res = recoverPending(); res.has_error()) {
          SL_WARN(logger_,
                  "Can't recover unfinished tasks: {}",
                  res.error().message());
        }
      }
      if (auto res = requeueDeferred(); res.has_error()) {
        SL_WARN(logger_,
                "Can't queue deferred tasks: {}",
                res.error().message());
      }
    }
  }

  outcome::result<void> DispatchRouter::refreshParticipants() {
    OUTCOME_TRY(participants, participants_->getAll());
    OUTCOME_TRY(scores, scores_->getAll());
    selector_->update(participants, scores);
    SL_DEBUG(logger_, "{} participants eligible", selector_->size());
    return outcome::success();
  }

  outcome::result<ProcessResult> DispatchRouter::processNext(
      std::chrono::milliseconds timeout) {
    OUTCOME_TRY(entry, queue_->next(timeout));
    if (not entry) {
      return ProcessResult::Idle;
    }
    return process(*entry);
  }

  outcome::result<ProcessResult> DispatchRouter::process(
      const QueueEntry &entry) {
    auto lease_key = cache::keys::taskLease(entry.task_id);
    auto lease_ttl = std::min(config_.lease_ttl,
                              remainingUntil(entry.deadline, clock_->now()));
    if (lease_ttl == std::chrono::milliseconds::zero()) {
      lease_ttl = std::min(config_.lease_ttl, kOverdueLeaseTtl);
    }
    OUTCOME_TRY(acquired, leases_->acquire(lease_key, lease_ttl));
    if (not acquired) {
      SL_DEBUG(logger_, "Task {} is owned by another router", entry.task_id);
      return ProcessResult::Skipped;
    }

    auto loaded = tasks_->get(entry.task_id);
    if (loaded.has_error()) {
      releaseLease(lease_key);
      return loaded.as_failure();
    }
    auto &task = loaded.value();
    if (not task or primitives::isTerminal(task->status)) {
      releaseLease(lease_key);
      return ProcessResult::Skipped;
    }

    auto result = dispatch(std::move(*task), lease_key);
    if (result.has_error()) {
      // The lease lapses and recovery picks the task up
      SL_WARN(logger_,
              "Dispatch of task {} interrupted: {}",
              entry.task_id,
              result.error().message());
    }
    return result;
  }

  outcome::result<ProcessResult> DispatchRouter::dispatch(
      primitives::Task task, const std::string &lease_key) {
    std::set<primitives::Hotkey> tried;
    OUTCOME_TRY(previous, scoring_->outcomesOf(task.id));
    for (auto &outcome : previous) {
      tried.insert(outcome.hotkey);
    }

    // A task found dispatched was abandoned by a crashed router
    if (task.status == primitives::TaskStatus::Dispatched) {
      auto abandoned = task;
      task.status = primitives::TaskStatus::Pending;
      task.assigned_participant.reset();
      OUTCOME_TRY(updated,
                  tasks_->update(task, primitives::TaskStatus::Dispatched));
      if (not updated) {
        releaseLease(lease_key);
        return ProcessResult::Skipped;
      }
      if (abandoned.assigned_participant) {
        tried.insert(*abandoned.assigned_participant);
      }
    }

    while (true) {
      auto now = clock_->now();
      auto remaining = remainingUntil(task.deadline, now);
      if (remaining == std::chrono::milliseconds::zero()) {
        return finish(std::move(task), primitives::TaskStatus::Expired, {});
      }
      if (task.attempts >= config_.max_attempts) {
        return finish(std::move(task), primitives::TaskStatus::Failed, {});
      }

      auto participant = selector_->select(tried);
      if (not participant and task.attempts > 0 and selector_->size() > 0) {
        SL_DEBUG(logger_,
                 "Every eligible participant failed task {}",
                 task.id);
        return finish(std::move(task), primitives::TaskStatus::Failed, {});
      }
      if (not participant) {
        SL_DEBUG(logger_,
                 "No participant for task {}, {} tried",
                 task.id,
                 tried.size());
        defer(task);
        releaseLease(lease_key);
        return ProcessResult::Deferred;
      }

      auto dispatched = task;
      dispatched.status = primitives::TaskStatus::Dispatched;
      dispatched.assigned_participant = participant->hotkey;
      ++dispatched.attempts;
      OUTCOME_TRY(updated,
                  tasks_->update(dispatched, primitives::TaskStatus::Pending));
      if (not updated) {
        releaseLease(lease_key);
        return ProcessResult::Skipped;
      }
      task = std::move(dispatched);

      auto lease_ttl = std::min(config_.lease_ttl, remaining);
      OUTCOME_TRY(extended, leases_->extend(lease_key, lease_ttl));
      if (not extended) {
        SL_WARN(logger_, "Lease of task {} was lost", task.id);
      }

      auto timeout = std::min(config_.request_timeout, remaining);
      auto sent_at = clock_->now();
      auto response = worker_client_->perform(*participant, task, timeout);
      auto received_at = clock_->now();
      auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          received_at - sent_at);
      metric_latency_->observe(static_cast<double>(latency.count()) / 1000.);

      if (response.has_value() and received_at <= task.deadline) {
        auto quality = responseQuality(latency, timeout);
        OUTCOME_TRY(recordAttempt(
            task, participant->hotkey, latency, true, quality));
        return finish(std::move(task),
                      primitives::TaskStatus::Completed,
                      {
                          .participant = participant->hotkey,
                          .latency = latency,
                          .quality = quality,
                          .response = std::move(response.value()),
                      });
      }

      metric_attempt_failures_->inc();
      OUTCOME_TRY(recordAttempt(task, participant->hotkey, latency, false, 0.));
      tried.insert(participant->hotkey);

      if (response.has_value()) {
        SL_DEBUG(logger_,
                 "Answer of {} for task {} came after the deadline",
                 participant->hotkey,
                 task.id);
        return finish(std::move(task),
                      primitives::TaskStatus::Expired,
                      {.participant = participant->hotkey,
                       .latency = latency});
      }
      SL_DEBUG(logger_,
               "Attempt {} of task {} on {} failed: {}",
               task.attempts,
               task.id,
               participant->hotkey,
               response.error().message());

      if (task.attempts >= config_.max_attempts) {
        return finish(std::move(task),
                      primitives::TaskStatus::Failed,
                      {.participant = participant->hotkey,
                       .latency = latency});
      }

      auto retry = task;
      retry.status = primitives::TaskStatus::Pending;
      retry.assigned_participant.reset();
      OUTCOME_TRY(reset,
                  tasks_->update(retry, primitives::TaskStatus::Dispatched));
      if (not reset) {
        releaseLease(lease_key);
        return ProcessResult::Skipped;
      }
      task = std::move(retry);

      auto delay = std::min(backoffDelay(config_.backoff, task.attempts),
                            remainingUntil(task.deadline, clock_->now()));
      if (stop_signal_.waitFor(delay)) {
        // Shutdown, the task is recovered after the lease lapses
        return ProcessResult::Skipped;
      }
    }
  }

  outcome::result<ProcessResult> DispatchRouter::finish(
      primitives::Task task,
      primitives::TaskStatus status,
      primitives::TaskResult result) {
    BOOST_ASSERT(primitives::isTerminal(status));
    auto expected = task.status;
    task.status = status;
    OUTCOME_TRY(updated, tasks_->update(task, expected));
    auto lease_key = cache::keys::taskLease(task.id);
    if (not updated) {
      releaseLease(lease_key);
      return ProcessResult::Skipped;
    }

    result.task_id = task.id;
    result.status = status;
    if (auto res = cache_->publish(cache::keys::kTaskResultsChannel,
                                   encodeTaskResult(result));
        res.has_error()) {
      // Waiting gateways time out on their own
      SL_WARN(logger_,
              "Can't announce result of task {}: {}",
              task.id,
              res.error().message());
    }
    releaseLease(lease_key);

    switch (status) {
      case primitives::TaskStatus::Completed:
        metric_completed_->inc();
        SL_DEBUG(logger_,
                 "Task {} completed by {} in {} ms",
                 task.id,
                 result.participant.value_or("?"),
                 result.latency.count());
        return ProcessResult::Completed;
      case primitives::TaskStatus::Expired:
        metric_expired_->inc();
        SL_DEBUG(logger_, "Task {} expired", task.id);
        return ProcessResult::Expired;
      default:
        metric_failed_->inc();
        SL_DEBUG(logger_,
                 "Task {} failed after {} attempts",
                 task.id,
                 task.attempts);
        return ProcessResult::Failed;
    }
  }

  outcome::result<void> DispatchRouter::recordAttempt(
      const primitives::Task &task,
      const primitives::Hotkey &hotkey,
      std::chrono::milliseconds latency,
      bool success,
      double quality) {
    return scoring_->recordOutcome({
        .task_id = task.id,
        .hotkey = hotkey,
        .latency = latency,
        .success = success,
        .quality = quality,
        .timestamp = clock_->now(),
    });
  }

  void DispatchRouter::defer(const primitives::Task &task) {
    auto at = clock_->now() + config_.idle_requeue_delay;
    deferred_.exclusiveAccess(
        [&](auto &deferred) { deferred.emplace(at, task); });
  }

  void DispatchRouter::releaseLease(const std::string &lease_key) {
    if (auto res = leases_->release(lease_key); res.has_error()) {
      SL_WARN(logger_,
              "Can't release {}, it lapses by itself: {}",
              lease_key,
              res.error().message());
    }
  }

  outcome::result<size_t> DispatchRouter::requeueDeferred() {
    auto now = clock_->now();
    auto due = deferred_.exclusiveAccess([&](auto &deferred) {
      std::vector<primitives::Task> ready;
      auto end = deferred.upper_bound(now);
      for (auto it = deferred.begin(); it != end; ++it) {
        ready.emplace_back(std::move(it->second));
      }
      deferred.erase(deferred.begin(), end);
      return ready;
    });

    size_t queued = 0;
    for (auto it = due.begin(); it != due.end(); ++it) {
      auto res = queue_->requeue(*it);
      if (res.has_error()) {
        // Keep the rest for the next round
        deferred_.exclusiveAccess([&](auto &deferred) {
          for (; it != due.end(); ++it) {
            deferred.emplace(now, std::move(*it));
          }
        });
        return res.as_failure();
      }
      ++queued;
    }
    return queued;
  }

  outcome::result<size_t> DispatchRouter::recoverPending() {
    OUTCOME_TRY(unfinished, tasks_->getNonTerminal());
    if (unfinished.empty()) {
      return size_t{0};
    }

    // Tasks still waiting in the queue or here need no recovery
    std::set<primitives::TaskId> waiting;
    OUTCOME_TRY(entries, cache_->listRange(cache::keys::kQueryQueue));
    for (auto &message : entries) {
      if (auto entry = decodeQueueEntry(message); entry.has_value()) {
        waiting.insert(entry.value().task_id);
      }
    }
    deferred_.sharedAccess([&](const auto &deferred) {
      for (auto &[at, task] : deferred) {
        waiting.insert(task.id);
      }
    });

    auto now = clock_->now();
    size_t queued = 0;
    for (auto &task : unfinished) {
      if (waiting.contains(task.id)) {
        continue;
      }
      OUTCOME_TRY(held, leases_->isHeld(cache::keys::taskLease(task.id)));
      if (held) {
        continue;
      }
      if (task.deadline <= now) {
        auto lease_key = cache::keys::taskLease(task.id);
        OUTCOME_TRY(acquired,
                    leases_->acquire(
                        lease_key, std::min(config_.lease_ttl, kOverdueLeaseTtl)));
        if (acquired) {
          OUTCOME_TRY(finish(task,
                             primitives::TaskStatus::Expired,
                             {.participant = task.assigned_participant}));
        }
        continue;
      }
      OUTCOME_TRY(queue_->requeue(task));
      ++queued;
    }
    if (queued != 0) {
      SL_INFO(logger_, "Recovered {} unfinished tasks", queued);
    }
    return queued;
  }

}  // namespace nineteen::dispatch
