/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/result_waiter.hpp"

#include <boost/assert.hpp>

#include "cache/cache_keys.hpp"
#include "dispatch/messages.hpp"

namespace nineteen::gateway {

  ResultWaiter::ResultWaiter(std::shared_ptr<cache::CoordinationCache> cache)
      : cache_{std::move(cache)},
        logger_{log::createLogger("ResultWaiter", "gateway")} {
    BOOST_ASSERT(cache_ != nullptr);
  }

  outcome::result<void> ResultWaiter::subscribe() {
    return cache_->subscribe(
        cache::keys::kTaskResultsChannel,
        [this](const std::string &message) { onMessage(message); });
  }

  std::future<primitives::TaskResult> ResultWaiter::expect(
      const primitives::TaskId &id) {
    return waiting_.exclusiveAccess([&](auto &waiting) {
      return waiting[id].get_future();
    });
  }

  void ResultWaiter::cancel(const primitives::TaskId &id) {
    waiting_.exclusiveAccess([&](auto &waiting) { waiting.erase(id); });
  }

  void ResultWaiter::onMessage(const std::string &message) {
    auto result = dispatch::decodeTaskResult(message);
    if (result.has_error()) {
      SL_WARN(logger_, "Malformed task result: {}", message);
      return;
    }
    auto &task_result = result.value();
    auto promise = waiting_.exclusiveAccess(
        [&](auto &waiting) -> std::optional<std::promise<primitives::TaskResult>> {
          auto it = waiting.find(task_result.task_id);
          if (it == waiting.end()) {
            return std::nullopt;
          }
          auto found = std::move(it->second);
          waiting.erase(it);
          return found;
        });
    // Results of tasks submitted through other gateways are ignored
    if (promise) {
      SL_TRACE(logger_, "Result of task {} arrived", task_result.task_id);
      promise->set_value(std::move(task_result));
    }
  }

  size_t ResultWaiter::pending() const {
    return waiting_.sharedAccess(
        [](const auto &waiting) { return waiting.size(); });
  }

}  // namespace nineteen::gateway
