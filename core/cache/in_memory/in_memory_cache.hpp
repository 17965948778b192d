/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cache/coordination_cache.hpp"

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>

#include "clock/clock.hpp"

namespace nineteen::cache {

  /**
   * Process local cache with the semantics of the Redis one. Expiry follows
   * the injected clock, messages are delivered synchronously by publish().
   */
  class InMemoryCache : public CoordinationCache {
   public:
    explicit InMemoryCache(std::shared_ptr<clock::SteadyClock> clock);

    outcome::result<std::optional<std::string>> get(
        std::string_view key) override;
    outcome::result<void> set(std::string_view key,
                              std::string_view value,
                              Ttl ttl) override;
    outcome::result<bool> setIfAbsent(std::string_view key,
                                      std::string_view value,
                                      Ttl ttl) override;
    outcome::result<bool> compareAndDelete(std::string_view key,
                                           std::string_view expected) override;
    outcome::result<bool> extendIfEquals(
        std::string_view key,
        std::string_view expected,
        std::chrono::milliseconds ttl) override;
    outcome::result<void> remove(std::string_view key) override;
    outcome::result<int64_t> incrementBy(std::string_view key,
                                         int64_t delta,
                                         Ttl ttl) override;

    outcome::result<size_t> pushBackBounded(std::string_view list,
                                            std::string_view value,
                                            size_t capacity) override;
    outcome::result<size_t> pushBack(std::string_view list,
                                     std::string_view value) override;
    outcome::result<std::optional<std::string>> popFront(
        std::string_view list, std::chrono::milliseconds timeout) override;
    outcome::result<size_t> length(std::string_view list) override;
    outcome::result<std::vector<std::string>> listRange(
        std::string_view list) override;
    outcome::result<size_t> removeFromList(std::string_view list,
                                           std::string_view value) override;

    outcome::result<void> publish(std::string_view channel,
                                  std::string_view message) override;
    outcome::result<void> subscribe(std::string_view channel,
                                    MessageHandler handler) override;

    /// Drops everything, as a restarted cache server would
    void clear();

   private:
    struct Entry {
      std::string value;
      std::optional<clock::SteadyClock::TimePoint> expires_at;
    };

    /// Returns live entry or nullptr, dropping it if expired
    Entry *findLive(std::string_view key);
    std::optional<clock::SteadyClock::TimePoint> expiry(Ttl ttl) const;

    std::shared_ptr<clock::SteadyClock> clock_;
    std::mutex mutex_;
    std::condition_variable list_cv_;
    std::map<std::string, Entry, std::less<>> values_;
    std::map<std::string, std::deque<std::string>, std::less<>> lists_;
    std::map<std::string, std::vector<MessageHandler>, std::less<>>
        subscribers_;
  };

}  // namespace nineteen::cache
