/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cache/redis/redis_cache.hpp"

#include <iterator>
#include <type_traits>

#include <fmt/format.h>

#include "cache/cache_error.hpp"
#include "utils/backoff.hpp"

namespace nineteen::cache {

  namespace {
    constexpr std::string_view kCompareAndDelete = R"(
      if redis.call('get', KEYS[1]) == ARGV[1] then
        return redis.call('del', KEYS[1])
      end
      return 0)";

    constexpr std::string_view kExtendIfEquals = R"(
      if redis.call('get', KEYS[1]) == ARGV[1] then
        return redis.call('pexpire', KEYS[1], ARGV[2])
      end
      return 0)";

    constexpr std::string_view kIncrementBy = R"(
      local existed = redis.call('exists', KEYS[1])
      local value = redis.call('incrby', KEYS[1], ARGV[1])
      if existed == 0 and tonumber(ARGV[2]) > 0 then
        redis.call('pexpire', KEYS[1], ARGV[2])
      end
      return value)";

    constexpr std::string_view kPushBackBounded = R"(
      if redis.call('llen', KEYS[1]) >= tonumber(ARGV[2]) then
        return -1
      end
      return redis.call('rpush', KEYS[1], ARGV[1]))";

    /// Read timeout of the subscriber, how often it looks for new channels
    constexpr std::chrono::milliseconds kSubscriberPoll{200};

    sw::redis::ConnectionOptions connectionOptions(
        const RedisConfig &config, std::chrono::milliseconds socket_timeout) {
      sw::redis::ConnectionOptions options;
      options.host = config.host;
      options.port = config.port;
      options.password = config.password;
      options.db = static_cast<int>(config.database);
      options.connect_timeout = config.timeout;
      options.socket_timeout = socket_timeout;
      return options;
    }

    sw::redis::ConnectionPoolOptions poolOptions(const RedisConfig &config) {
      sw::redis::ConnectionPoolOptions options;
      options.size = std::max<size_t>(config.max_idle_connections, 1);
      options.wait_timeout = config.timeout;
      return options;
    }

    outcome::result<size_t> asSize(long long value) {
      if (value < 0) {
        return CacheError::UNEXPECTED_REPLY;
      }
      return static_cast<size_t>(value);
    }

    template <typename Optional>
    std::optional<std::string> toStd(const Optional &value) {
      if (not value) {
        return std::nullopt;
      }
      return std::string{*value};
    }
  }  // namespace

  RedisCache::RedisCache(RedisConfig config)
      : config_{std::move(config)},
        logger_{log::createLogger("RedisCache", "redis")},
        redis_{connectionOptions(config_, config_.timeout),
               poolOptions(config_)},
        // server side BLPOP timeout bounds the read
        blocking_{connectionOptions(config_, std::chrono::milliseconds{0}),
                  poolOptions(config_)} {
    SL_DEBUG(logger_, "Using redis at {}:{}", config_.host, config_.port);
  }

  RedisCache::~RedisCache() {
    stop();
  }

  void RedisCache::stop() {
    stop_signal_.stop();
    if (subscriber_thread_) {
      subscriber_thread_->stop();
    }
  }

  template <typename Command>
  auto RedisCache::call(std::string_view name, Command &&command)
      -> outcome::result<decltype(command())> {
    try {
      if constexpr (std::is_void_v<decltype(command())>) {
        command();
        return outcome::success();
      } else {
        return command();
      }
    } catch (const sw::redis::TimeoutError &e) {
      SL_WARN(logger_, "{} timed out: {}", name, e.what());
      return CacheError::TIMEOUT;
    } catch (const sw::redis::ReplyError &e) {
      SL_WARN(logger_, "{} failed on server: {}", name, e.what());
      return CacheError::SERVER_ERROR;
    } catch (const sw::redis::ProtoError &e) {
      SL_WARN(logger_, "{} got malformed reply: {}", name, e.what());
      return CacheError::PROTOCOL_ERROR;
    } catch (const sw::redis::Error &e) {
      SL_WARN(logger_, "{} failed: {}", name, e.what());
      return CacheError::CONNECTION_FAILED;
    }
  }

  outcome::result<std::optional<std::string>> RedisCache::get(
      std::string_view key) {
    OUTCOME_TRY(value, call("GET", [&] { return redis_.get(key); }));
    return toStd(value);
  }

  outcome::result<void> RedisCache::set(std::string_view key,
                                        std::string_view value,
                                        Ttl ttl) {
    // zero ttl means no expiry
    auto expiry = ttl.value_or(std::chrono::milliseconds{0});
    OUTCOME_TRY(call("SET", [&] { return redis_.set(key, value, expiry); }));
    return outcome::success();
  }

  outcome::result<bool> RedisCache::setIfAbsent(std::string_view key,
                                                std::string_view value,
                                                Ttl ttl) {
    auto expiry = ttl.value_or(std::chrono::milliseconds{0});
    return call("SET NX", [&] {
      return redis_.set(key, value, expiry, sw::redis::UpdateType::NOT_EXIST);
    });
  }

  outcome::result<bool> RedisCache::compareAndDelete(
      std::string_view key, std::string_view expected) {
    OUTCOME_TRY(removed, call("EVAL compare-and-delete", [&] {
                  return redis_.eval<long long>(
                      kCompareAndDelete, {key}, {expected});
                }));
    return removed == 1;
  }

  outcome::result<bool> RedisCache::extendIfEquals(
      std::string_view key,
      std::string_view expected,
      std::chrono::milliseconds ttl) {
    auto ms = std::to_string(ttl.count());
    OUTCOME_TRY(extended, call("EVAL extend", [&] {
                  return redis_.eval<long long>(
                      kExtendIfEquals, {key}, {expected, std::string_view{ms}});
                }));
    return extended == 1;
  }

  outcome::result<void> RedisCache::remove(std::string_view key) {
    OUTCOME_TRY(call("DEL", [&] { return redis_.del(key); }));
    return outcome::success();
  }

  outcome::result<int64_t> RedisCache::incrementBy(std::string_view key,
                                                   int64_t delta,
                                                   Ttl ttl) {
    auto delta_str = std::to_string(delta);
    auto ttl_str = std::to_string(ttl ? ttl->count() : 0);
    OUTCOME_TRY(value, call("EVAL increment", [&] {
                  return redis_.eval<long long>(
                      kIncrementBy,
                      {key},
                      {std::string_view{delta_str}, std::string_view{ttl_str}});
                }));
    return static_cast<int64_t>(value);
  }

  outcome::result<size_t> RedisCache::pushBackBounded(std::string_view list,
                                                      std::string_view value,
                                                      size_t capacity) {
    auto capacity_str = std::to_string(capacity);
    OUTCOME_TRY(length, call("EVAL bounded push", [&] {
                  return redis_.eval<long long>(
                      kPushBackBounded,
                      {list},
                      {value, std::string_view{capacity_str}});
                }));
    if (length < 0) {
      return CacheError::LIST_FULL;
    }
    return static_cast<size_t>(length);
  }

  outcome::result<size_t> RedisCache::pushBack(std::string_view list,
                                               std::string_view value) {
    OUTCOME_TRY(length, call("RPUSH", [&] { return redis_.rpush(list, value); }));
    return asSize(length);
  }

  outcome::result<std::optional<std::string>> RedisCache::popFront(
      std::string_view list, std::chrono::milliseconds timeout) {
    if (timeout <= std::chrono::milliseconds::zero()) {
      OUTCOME_TRY(value, call("LPOP", [&] { return redis_.lpop(list); }));
      return toStd(value);
    }
    // fractional seconds, zero would block forever
    auto seconds = fmt::format("{:.3f}", timeout.count() / 1000.0);
    OUTCOME_TRY(popped, call("BLPOP", [&] {
                  return blocking_.command<sw::redis::OptionalStringPair>(
                      "BLPOP", std::string{list}, seconds);
                }));
    if (not popped) {
      return std::optional<std::string>{};
    }
    return std::make_optional(std::string{popped->second});
  }

  outcome::result<size_t> RedisCache::length(std::string_view list) {
    OUTCOME_TRY(length, call("LLEN", [&] { return redis_.llen(list); }));
    return asSize(length);
  }

  outcome::result<std::vector<std::string>> RedisCache::listRange(
      std::string_view list) {
    std::vector<std::string> values;
    OUTCOME_TRY(call("LRANGE", [&] {
      redis_.lrange(list, 0, -1, std::back_inserter(values));
    }));
    return values;
  }

  outcome::result<size_t> RedisCache::removeFromList(std::string_view list,
                                                     std::string_view value) {
    OUTCOME_TRY(removed,
                call("LREM", [&] { return redis_.lrem(list, 0, value); }));
    return asSize(removed);
  }

  outcome::result<void> RedisCache::publish(std::string_view channel,
                                            std::string_view message) {
    OUTCOME_TRY(
        call("PUBLISH", [&] { return redis_.publish(channel, message); }));
    return outcome::success();
  }

  outcome::result<void> RedisCache::subscribe(std::string_view channel,
                                              MessageHandler handler) {
    std::lock_guard lock{subscribers_mutex_};
    subscribers_[std::string{channel}].emplace_back(std::move(handler));
    resubscribe_ = true;
    if (not subscriber_thread_) {
      subscriber_thread_ = std::make_unique<ThreadPool>("redis-sub", 1);
      subscriber_thread_->post([this] { consumeMessages(); });
    }
    return outcome::success();
  }

  void RedisCache::onMessage(const std::string &channel,
                             const std::string &message) {
    std::vector<MessageHandler> handlers;
    {
      std::lock_guard lock{subscribers_mutex_};
      if (auto it = subscribers_.find(channel); it != subscribers_.end()) {
        handlers = it->second;
      }
    }
    for (auto &handler : handlers) {
      handler(message);
    }
  }

  void RedisCache::consumeMessages() {
    auto options = connectionOptions(config_, kSubscriberPoll);
    BackoffPolicy backoff;
    uint32_t failures = 0;

    while (not stop_signal_.stopped()) {
      try {
        sw::redis::Redis client{options};
        auto subscriber = client.subscriber();
        subscriber.on_message([this](std::string channel, std::string message) {
          onMessage(channel, message);
        });
        {
          std::lock_guard lock{subscribers_mutex_};
          resubscribe_ = true;
        }

        while (not stop_signal_.stopped()) {
          std::vector<std::string> channels;
          {
            std::lock_guard lock{subscribers_mutex_};
            if (resubscribe_) {
              for (auto &[channel, _] : subscribers_) {
                channels.push_back(channel);
              }
              resubscribe_ = false;
            }
          }
          if (not channels.empty()) {
            subscriber.subscribe(channels.begin(), channels.end());
            SL_DEBUG(logger_, "Subscribed to {} channels", channels.size());
          }
          try {
            subscriber.consume();
            failures = 0;
          } catch (const sw::redis::TimeoutError &) {
            // nothing published within the poll interval
          }
        }
      } catch (const sw::redis::Error &e) {
        ++failures;
        SL_WARN(logger_, "Subscriber connection failed: {}", e.what());
        if (stop_signal_.waitFor(backoffDelay(backoff, failures))) {
          break;
        }
      }
    }
  }

}  // namespace nineteen::cache
