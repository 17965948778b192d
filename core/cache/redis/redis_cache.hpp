/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cache/coordination_cache.hpp"

#include <map>
#include <memory>
#include <mutex>

#include <sw/redis++/redis++.h>

#include "cache/redis/redis_config.hpp"
#include "log/logger.hpp"
#include "utils/stop_signal.hpp"
#include "utils/thread_pool.hpp"

namespace nineteen::cache {

  /**
   * Coordination cache backed by a Redis server. Commands share a pool of
   * connections. Blocking pops use a client of their own, whose reads wait as
   * long as the server blocks. Subscriptions are consumed on one thread,
   * which subscribes again after a reconnect.
   */
  class RedisCache : public CoordinationCache {
   public:
    explicit RedisCache(RedisConfig config);
    ~RedisCache() override;

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

    /// Stops the subscriber thread
    void stop();

   private:
    /// Runs \param command, turning client exceptions into CacheError
    template <typename Command>
    auto call(std::string_view name, Command &&command)
        -> outcome::result<decltype(command())>;

    void consumeMessages();
    void onMessage(const std::string &channel, const std::string &message);

    RedisConfig config_;
    log::Logger logger_;

    sw::redis::Redis redis_;
    sw::redis::Redis blocking_;

    std::mutex subscribers_mutex_;
    std::map<std::string, std::vector<MessageHandler>, std::less<>>
        subscribers_;
    /// Set when a channel was added and the subscriber must SUBSCRIBE again
    bool resubscribe_ = false;
    StopSignal stop_signal_;
    std::unique_ptr<ThreadPool> subscriber_thread_;
  };

}  // namespace nineteen::cache
