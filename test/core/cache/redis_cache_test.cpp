/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cache/redis/redis_cache.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <thread>

#include "cache/cache_error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using nineteen::cache::CacheError;
using nineteen::cache::RedisCache;
using nineteen::cache::RedisConfig;

class RedisCacheTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  /// Port nobody listens on: bound once, then released
  static uint16_t closedPort() {
    boost::asio::io_context io_context;
    boost::asio::ip::tcp::acceptor acceptor{
        io_context,
        {boost::asio::ip::make_address("127.0.0.1"), 0}};
    return acceptor.local_endpoint().port();
  }

  RedisConfig config() const {
    RedisConfig config;
    config.host = "127.0.0.1";
    config.port = closedPort();
    config.timeout = 500ms;
    config.max_idle_connections = 2;
    return config;
  }
};

/**
 * @given cache pointing to a port without a server
 * @when commands are run
 * @then each fails with CONNECTION_FAILED instead of throwing
 */
TEST_F(RedisCacheTest, UnreachableServer) {
  RedisCache cache{config()};
  EXPECT_EC(cache.get("k"), CacheError::CONNECTION_FAILED);
  EXPECT_EC(cache.set("k", "v", 1s), CacheError::CONNECTION_FAILED);
  EXPECT_EC(cache.compareAndDelete("k", "v"), CacheError::CONNECTION_FAILED);
  EXPECT_EC(cache.pushBackBounded("q", "v", 10),
            CacheError::CONNECTION_FAILED);
  EXPECT_EC(cache.popFront("q", 100ms), CacheError::CONNECTION_FAILED);
  EXPECT_EC(cache.listRange("q"), CacheError::CONNECTION_FAILED);
  EXPECT_EC(cache.publish("c", "m"), CacheError::CONNECTION_FAILED);
}

/**
 * @given cache pointing to a port without a server
 * @when a channel is subscribed and the cache is stopped
 * @then subscription is accepted and the retrying subscriber stops
 */
TEST_F(RedisCacheTest, SubscriberStopsWhileReconnecting) {
  RedisCache cache{config()};
  EXPECT_OUTCOME_TRUE_1(cache.subscribe("c", [](const std::string &) {}));
  std::this_thread::sleep_for(50ms);
  cache.stop();
}
