/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "cache/coordination_cache.hpp"
#include "log/logger.hpp"

namespace nineteen::cache {

  /**
   * Expiring exclusive claims stored in the cache. A lease holds the owner
   * token of this process, so only the owner can extend or release it, and a
   * crashed owner's lease lapses after its ttl.
   */
  class LeaseManager {
   public:
    explicit LeaseManager(std::shared_ptr<CoordinationCache> cache);

    const std::string &ownerToken() const {
      return owner_;
    }

    /// @return false if the lease is held by someone
    outcome::result<bool> acquire(std::string_view key,
                                  std::chrono::milliseconds ttl);

    /// @return false if the lease is not ours anymore
    outcome::result<bool> extend(std::string_view key,
                                 std::chrono::milliseconds ttl);

    outcome::result<bool> release(std::string_view key);

    /// True if anyone holds the lease
    outcome::result<bool> isHeld(std::string_view key);

   private:
    std::shared_ptr<CoordinationCache> cache_;
    std::string owner_;
    log::Logger logger_;
  };

}  // namespace nineteen::cache
