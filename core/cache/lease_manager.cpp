/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cache/lease_manager.hpp"

#include <boost/assert.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace nineteen::cache {

  LeaseManager::LeaseManager(std::shared_ptr<CoordinationCache> cache)
      : cache_{std::move(cache)},
        owner_{boost::uuids::to_string(boost::uuids::random_generator{}())},
        logger_{log::createLogger("LeaseManager", "cache")} {
    BOOST_ASSERT(cache_ != nullptr);
    SL_DEBUG(logger_, "Lease owner token {}", owner_);
  }

  outcome::result<bool> LeaseManager::acquire(std::string_view key,
                                              std::chrono::milliseconds ttl) {
    OUTCOME_TRY(acquired, cache_->setIfAbsent(key, owner_, ttl));
    SL_TRACE(logger_,
             "Lease {} {}",
             key,
             acquired ? "acquired" : "is held by another owner");
    return acquired;
  }

  outcome::result<bool> LeaseManager::extend(std::string_view key,
                                             std::chrono::milliseconds ttl) {
    return cache_->extendIfEquals(key, owner_, ttl);
  }

  outcome::result<bool> LeaseManager::release(std::string_view key) {
    OUTCOME_TRY(released, cache_->compareAndDelete(key, owner_));
    if (not released) {
      SL_DEBUG(logger_, "Lease {} had already lapsed", key);
    }
    return released;
  }

  outcome::result<bool> LeaseManager::isHeld(std::string_view key) {
    OUTCOME_TRY(value, cache_->get(key));
    return value.has_value();
  }

}  // namespace nineteen::cache
