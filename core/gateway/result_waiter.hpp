/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <future>
#include <memory>
#include <unordered_map>

#include "cache/coordination_cache.hpp"
#include "log/logger.hpp"
#include "primitives/task.hpp"
#include "utils/safe_object.hpp"

namespace nineteen::gateway {

  /**
   * Delivers task results announced by routers to local callers. A caller
   * registers interest before its task is queued, so a fast result is never
   * missed.
   */
  class ResultWaiter {
   public:
    explicit ResultWaiter(std::shared_ptr<cache::CoordinationCache> cache);

    /// Subscribes to the results channel
    outcome::result<void> subscribe();

    std::future<primitives::TaskResult> expect(const primitives::TaskId &id);

    /// Stops waiting for \param id
    void cancel(const primitives::TaskId &id);

    void onMessage(const std::string &message);

    size_t pending() const;

   private:
    std::shared_ptr<cache::CoordinationCache> cache_;
    SafeObject<
        std::unordered_map<primitives::TaskId,
                           std::promise<primitives::TaskResult>>>
        waiting_;
    log::Logger logger_;
  };

}  // namespace nineteen::gateway
