/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/intake_gateway.hpp"

#include <algorithm>

#include <boost/assert.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "cache/cache_keys.hpp"
#include "dispatch/dispatch_error.hpp"
#include "gateway/gateway_error.hpp"

namespace nineteen::gateway {

  namespace {
    constexpr auto kRequestsMetric = "nineteen_gateway_requests_total";

    constexpr std::chrono::milliseconds kRateWindow{std::chrono::minutes(1)};
  }  // namespace

  IntakeGateway::IntakeGateway(
      GatewayConfig config,
      std::vector<primitives::TaskType> task_types,
      std::shared_ptr<dispatch::TaskQueue> queue,
      std::shared_ptr<cache::CoordinationCache> cache,
      std::shared_ptr<ResultWaiter> waiter,
      std::shared_ptr<clock::SystemClock> clock)
      : config_{std::move(config)},
        task_types_{std::move(task_types)},
        queue_{std::move(queue)},
        cache_{std::move(cache)},
        waiter_{std::move(waiter)},
        clock_{std::move(clock)},
        logger_{log::createLogger("IntakeGateway", "gateway")} {
    BOOST_ASSERT(queue_ != nullptr);
    BOOST_ASSERT(cache_ != nullptr);
    BOOST_ASSERT(waiter_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);

    metrics_registry_->registerCounterFamily(kRequestsMetric,
                                             "Organic requests received");
    metric_requests_ = metrics_registry_->registerCounterMetric(kRequestsMetric);
  }

  bool IntakeGateway::prepare() {
    if (config_.api_keys.empty()) {
      SL_WARN(logger_, "No api keys configured, every request is refused");
    }
    if (auto res = waiter_->subscribe(); res.has_error()) {
      SL_ERROR(logger_,
               "Can't subscribe to task results: {}",
               res.error().message());
      return false;
    }
    return true;
  }

  outcome::result<SubmitResponse> IntakeGateway::submit(
      const SubmitRequest &request) {
    metric_requests_->inc();
    if (not config_.api_keys.contains(request.api_key)) {
      return GatewayError::UNAUTHORIZED;
    }
    OUTCOME_TRY(checkRateLimit(request.api_key));
    OUTCOME_TRY(task, makeTask(request));

    auto task_id = task.id;
    auto deadline = task.deadline;
    auto task_type = task.task_type;

    std::optional<std::future<primitives::TaskResult>> result;
    if (request.wait) {
      result.emplace(waiter_->expect(task_id));
    }

    auto queued = queue_->enqueue(std::move(task));
    if (queued.has_error()) {
      waiter_->cancel(task_id);
      if (queued.error() == dispatch::DispatchError::QUEUE_FULL) {
        return GatewayError::OVERLOADED;
      }
      if (queued.error() == dispatch::DispatchError::INVALID_TASK) {
        return GatewayError::REJECTED;
      }
      SL_WARN(logger_,
              "Can't queue task {}: {}",
              task_id,
              queued.error().message());
      return GatewayError::OVERLOADED;
    }
    takeSyntheticBudget(task_type);

    if (not result) {
      return SubmitResponse{.task_id = task_id};
    }

    auto now = clock_->now();
    auto wait_for = deadline > now
                      ? std::chrono::duration_cast<std::chrono::milliseconds>(
                            deadline - now)
                      : std::chrono::milliseconds::zero();
    if (result->wait_for(wait_for) != std::future_status::ready) {
      waiter_->cancel(task_id);
      SL_DEBUG(logger_, "No result of task {} before its deadline", task_id);
      return GatewayError::TIMEOUT;
    }
    return SubmitResponse{.task_id = task_id, .result = result->get()};
  }

  outcome::result<void> IntakeGateway::checkRateLimit(
      const std::string &api_key) {
    if (config_.rate_limit_per_minute <= 0) {
      return outcome::success();
    }
    auto minute = clock::toMillis(clock_->now()) / kRateWindow.count();
    OUTCOME_TRY(count,
                cache_->incrementBy(
                    cache::keys::rateLimit(api_key, minute), 1, kRateWindow * 2));
    if (count > config_.rate_limit_per_minute) {
      return GatewayError::RATE_LIMITED;
    }
    return outcome::success();
  }

  outcome::result<primitives::Task> IntakeGateway::makeTask(
      const SubmitRequest &request) {
    auto type = std::find_if(
        task_types_.begin(), task_types_.end(), [&](const auto &type) {
          return type.name == request.task_type;
        });
    if (type == task_types_.end() or not type->enabled) {
      return GatewayError::REJECTED;
    }
    if (request.payload.empty()) {
      return GatewayError::REJECTED;
    }
    auto timeout = request.timeout.value_or(type->timeout);
    if (timeout < config_.min_timeout or timeout > config_.max_timeout) {
      return GatewayError::REJECTED;
    }

    static thread_local boost::uuids::random_generator uuid_gen;
    auto now = clock_->now();
    return primitives::Task{
        .id = boost::uuids::to_string(uuid_gen()),
        .kind = primitives::TaskKind::Organic,
        .task_type = type->name,
        .payload = request.payload,
        .submitted_at = now,
        .deadline = now + timeout,
    };
  }

  void IntakeGateway::takeSyntheticBudget(const std::string &task_type) {
    auto res = cache_->incrementBy(
        cache::keys::syntheticRemaining(task_type), -1, std::nullopt);
    if (res.has_error()) {
      SL_DEBUG(logger_,
               "Can't take synthetic budget of {}: {}",
               task_type,
               res.error().message());
    }
  }

}  // namespace nineteen::gateway
