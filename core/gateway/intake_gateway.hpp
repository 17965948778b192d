/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <set>

#include "dispatch/task_queue.hpp"
#include "gateway/result_waiter.hpp"
#include "primitives/task_type.hpp"

namespace nineteen::gateway {

  struct GatewayConfig {
    /// Accepted values of the X-Api-Key header
    std::set<std::string> api_keys;

    /// Requests per api key and minute, 0 for no limit
    int64_t rate_limit_per_minute{600};

    std::chrono::milliseconds min_timeout{std::chrono::seconds(1)};
    std::chrono::milliseconds max_timeout{std::chrono::minutes(5)};
  };

  struct SubmitRequest {
    std::string api_key;
    std::string task_type;
    std::string payload;

    /// Task type's timeout if not given
    std::optional<std::chrono::milliseconds> timeout;

    /// Whether to wait for the result or return once queued
    bool wait{true};
  };

  struct SubmitResponse {
    primitives::TaskId task_id;

    /// Absent if the request did not wait
    std::optional<primitives::TaskResult> result;
  };

  /**
   * Entry point of organic traffic. Callers only ever see acceptance, a
   * final task result or one of GatewayError.
   */
  class IntakeGateway {
   public:
    IntakeGateway(GatewayConfig config,
                  std::vector<primitives::TaskType> task_types,
                  std::shared_ptr<dispatch::TaskQueue> queue,
                  std::shared_ptr<cache::CoordinationCache> cache,
                  std::shared_ptr<ResultWaiter> waiter,
                  std::shared_ptr<clock::SystemClock> clock);

    bool prepare();

    outcome::result<SubmitResponse> submit(const SubmitRequest &request);

   private:
    outcome::result<void> checkRateLimit(const std::string &api_key);
    outcome::result<primitives::Task> makeTask(const SubmitRequest &request);
    void takeSyntheticBudget(const std::string &task_type);

    GatewayConfig config_;
    std::vector<primitives::TaskType> task_types_;
    std::shared_ptr<dispatch::TaskQueue> queue_;
    std::shared_ptr<cache::CoordinationCache> cache_;
    std::shared_ptr<ResultWaiter> waiter_;
    std::shared_ptr<clock::SystemClock> clock_;
    log::Logger logger_;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();
    metrics::Counter *metric_requests_;
  };

}  // namespace nineteen::gateway
