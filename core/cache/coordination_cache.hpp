/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace nineteen::cache {

  using Ttl = std::optional<std::chrono::milliseconds>;

  /**
   * Shared transient state of all processes: key/value with expiry, atomic
   * counters, list queues and publish/subscribe. Nothing stored here is
   * assumed to survive.
   */
  class CoordinationCache {
   public:
    using MessageHandler = std::function<void(const std::string &message)>;

    virtual ~CoordinationCache() = default;

    virtual outcome::result<std::optional<std::string>> get(
        std::string_view key) = 0;

    virtual outcome::result<void> set(std::string_view key,
                                      std::string_view value,
                                      Ttl ttl) = 0;

    /**
     * Atomically sets the key unless it exists
     * @return true if the value was set
     */
    virtual outcome::result<bool> setIfAbsent(std::string_view key,
                                              std::string_view value,
                                              Ttl ttl) = 0;

    /// Removes the key if it holds \param expected
    virtual outcome::result<bool> compareAndDelete(
        std::string_view key, std::string_view expected) = 0;

    /// Resets expiry of the key if it holds \param expected
    virtual outcome::result<bool> extendIfEquals(
        std::string_view key,
        std::string_view expected,
        std::chrono::milliseconds ttl) = 0;

    virtual outcome::result<void> remove(std::string_view key) = 0;

    /**
     * Atomically adds \param delta to an integer key, a missing key counts as
     * zero. \param ttl is applied only when the key is created.
     * @return new value
     */
    virtual outcome::result<int64_t> incrementBy(std::string_view key,
                                                 int64_t delta,
                                                 Ttl ttl) = 0;

    /**
     * Appends to the list unless it already holds \param capacity elements.
     * The check and the append are one atomic operation.
     * @return new length, CacheError::LIST_FULL when full
     */
    virtual outcome::result<size_t> pushBackBounded(std::string_view list,
                                                    std::string_view value,
                                                    size_t capacity) = 0;

    /// Appends without a capacity check
    virtual outcome::result<size_t> pushBack(std::string_view list,
                                             std::string_view value) = 0;

    /**
     * Pops the head of the list, waiting up to \param timeout for an element
     * @return nullopt if the list stayed empty
     */
    virtual outcome::result<std::optional<std::string>> popFront(
        std::string_view list, std::chrono::milliseconds timeout) = 0;

    virtual outcome::result<size_t> length(std::string_view list) = 0;

    virtual outcome::result<std::vector<std::string>> listRange(
        std::string_view list) = 0;

    /// @return number of removed occurrences of \param value
    virtual outcome::result<size_t> removeFromList(std::string_view list,
                                                   std::string_view value) = 0;

    virtual outcome::result<void> publish(std::string_view channel,
                                          std::string_view message) = 0;

    /**
     * Registers \param handler for messages on \param channel. Handlers are
     * called from the cache's own thread.
     */
    virtual outcome::result<void> subscribe(std::string_view channel,
                                            MessageHandler handler) = 0;
  };

}  // namespace nineteen::cache
