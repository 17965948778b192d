/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <random>
#include <vector>

#include "application/app_state_manager.hpp"
#include "cache/coordination_cache.hpp"
#include "dispatch/task_queue.hpp"
#include "primitives/task_type.hpp"
#include "storage/participant_repository.hpp"
#include "utils/stop_signal.hpp"
#include "utils/thread_pool.hpp"

namespace nineteen::synthetic {

  struct SyntheticConfig {
    /// Whether synthetic traffic is produced at all
    bool enabled{true};

    std::chrono::milliseconds scoring_period{std::chrono::hours(1)};
    double scoring_period_multiplier{1.};
  };

  /// Planned synthetic requests of a task type for one scoring period
  struct TaskSchedule {
    std::string task_type;
    int64_t total_requests{};
    std::chrono::milliseconds interval{};
    primitives::Timestamp next_at{};
    int64_t remaining{};
  };

  /// floor(eligible * capacity * multiplier / volume_to_requests)
  int64_t plannedRequests(const primitives::TaskType &task_type,
                          size_t eligible,
                          double multiplier);

  /**
   * Spreads synthetic tasks evenly over a scoring period. The remaining
   * budget of each task type is shared with the gateway through the cache:
   * organic requests use it up and the scheduler skips ahead accordingly.
   */
  class SyntheticScheduler {
   public:
    SyntheticScheduler(application::AppStateManager &app_state_manager,
                       SyntheticConfig config,
                       std::vector<primitives::TaskType> task_types,
                       std::shared_ptr<dispatch::TaskQueue> queue,
                       std::shared_ptr<storage::ParticipantRepository> participants,
                       std::shared_ptr<cache::CoordinationCache> cache,
                       std::shared_ptr<clock::SystemClock> clock,
                       uint64_t seed = std::random_device{}());

    ~SyntheticScheduler();

    bool start();
    void stop();

    std::chrono::milliseconds periodLength() const;

    /**
     * Plans a new period: computes schedules, drops stale synthetic entries
     * from the queue and publishes the budgets
     * @return number of task types with planned requests
     */
    outcome::result<size_t> beginPeriod();

    /**
     * Handles every schedule due by now
     * @return number of enqueued synthetic tasks
     */
    outcome::result<size_t> tick();

    /// Time of the earliest pending schedule
    std::optional<primitives::Timestamp> nextAt() const;

    /// True when all budgets are spent or the period is over
    bool done() const;

    const std::vector<TaskSchedule> &schedules() const {
      return schedules_;
    }

   private:
    outcome::result<int64_t> remainingBudget(const std::string &task_type);
    outcome::result<bool> enqueueSynthetic(const primitives::TaskType &type);
    const primitives::TaskType *findType(const std::string &name) const;
    void updateGauges(const TaskSchedule &schedule, int64_t latest);
    void run();

    SyntheticConfig config_;
    std::vector<primitives::TaskType> task_types_;
    std::shared_ptr<dispatch::TaskQueue> queue_;
    std::shared_ptr<storage::ParticipantRepository> participants_;
    std::shared_ptr<cache::CoordinationCache> cache_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::mt19937_64 random_gen_;

    /// Min-heap by next_at
    std::vector<TaskSchedule> schedules_;
    primitives::Timestamp period_end_{};

    StopSignal stop_signal_;
    std::unique_ptr<ThreadPool> thread_pool_;
    log::Logger logger_;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();
  };

}  // namespace nineteen::synthetic
