/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>

#include "application/app_state_manager.hpp"
#include "cache/lease_manager.hpp"
#include "dispatch/participant_selector.hpp"
#include "dispatch/task_queue.hpp"
#include "dispatch/worker_client.hpp"
#include "metrics/metrics.hpp"
#include "scoring/scoring_engine.hpp"
#include "storage/participant_repository.hpp"
#include "storage/score_repository.hpp"
#include "utils/backoff.hpp"
#include "utils/safe_object.hpp"
#include "utils/stop_signal.hpp"
#include "utils/thread_pool.hpp"

namespace nineteen::dispatch {

  struct RouterConfig {
    /// Number of tasks in flight at once
    size_t workers{8};

    /// How long a worker waits on an empty queue
    std::chrono::milliseconds pop_timeout{std::chrono::seconds(1)};

    std::chrono::milliseconds lease_ttl{std::chrono::seconds(60)};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};
    uint32_t max_attempts{3};
    BackoffPolicy backoff{};

    /// Delay before a task nobody can take is queued again
    std::chrono::milliseconds idle_requeue_delay{std::chrono::seconds(1)};

    std::chrono::milliseconds recovery_interval{std::chrono::minutes(1)};
    std::chrono::milliseconds participant_refresh_interval{
        std::chrono::seconds(30)};
  };

  /**
   * What happened to a queue entry
   */
  enum class ProcessResult {
    Idle,       ///< queue was empty
    Skipped,    ///< task is gone, terminal or owned by another router
    Completed,
    Failed,
    Expired,
    Deferred,   ///< no participant available, queued again later
  };

  std::string_view toString(ProcessResult result);

  /// 1 for an instant answer, falling linearly to 0.5 at \param timeout
  double responseQuality(std::chrono::milliseconds latency,
                         std::chrono::milliseconds timeout);

  /**
   * Takes queued tasks, sends them to participants chosen by score and
   * records the outcome of every attempt. A task is handled by one router
   * at a time, guarded by an expiring lease.
   */
  class DispatchRouter {
   public:
    DispatchRouter(
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
        std::shared_ptr<ParticipantSelector> selector);

    bool prepare();
    bool start();
    void stop();

    /// Pops one entry, waiting up to \param timeout, and processes it
    outcome::result<ProcessResult> processNext(
        std::chrono::milliseconds timeout);

    outcome::result<ProcessResult> process(const QueueEntry &entry);

    /**
     * Queues again every unfinished task nobody holds a lease on and expires
     * overdue ones
     * @return number of queued tasks
     */
    outcome::result<size_t> recoverPending();

    /// Reloads eligible participants and their scores
    outcome::result<void> refreshParticipants();

    /// Queues deferred tasks whose delay has passed
    outcome::result<size_t> requeueDeferred();

   private:
    outcome::result<ProcessResult> dispatch(primitives::Task task,
                                            const std::string &lease_key);

    /// Moves \param task to terminal \param status and announces the result
    outcome::result<ProcessResult> finish(primitives::Task task,
                                          primitives::TaskStatus status,
                                          primitives::TaskResult result);

    outcome::result<void> recordAttempt(const primitives::Task &task,
                                        const primitives::Hotkey &hotkey,
                                        std::chrono::milliseconds latency,
                                        bool success,
                                        double quality);

    void defer(const primitives::Task &task);
    void releaseLease(const std::string &lease_key);

    void workerLoop();
    void maintenanceLoop();

    RouterConfig config_;
    std::shared_ptr<TaskQueue> queue_;
    std::shared_ptr<storage::TaskRepository> tasks_;
    std::shared_ptr<storage::ParticipantRepository> participants_;
    std::shared_ptr<storage::ScoreRepository> scores_;
    std::shared_ptr<scoring::ScoringEngine> scoring_;
    std::shared_ptr<WorkerClient> worker_client_;
    std::shared_ptr<cache::CoordinationCache> cache_;
    std::shared_ptr<cache::LeaseManager> leases_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<ParticipantSelector> selector_;

    std::unique_ptr<ThreadPool> thread_pool_;
    StopSignal stop_signal_;
    std::atomic_bool refresh_requested_{false};
    SafeObject<std::multimap<primitives::Timestamp, primitives::Task>>
        deferred_;

    log::Logger logger_;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();
    metrics::Counter *metric_completed_;
    metrics::Counter *metric_failed_;
    metrics::Counter *metric_expired_;
    metrics::Counter *metric_attempt_failures_;
    metrics::Histogram *metric_latency_;
  };

}  // namespace nineteen::dispatch
