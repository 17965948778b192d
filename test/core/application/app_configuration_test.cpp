/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <set>

#include "application/impl/app_configuration_impl.hpp"
#include "log/logger.hpp"
#include "testutil/prepare_loggers.hpp"

using nineteen::application::AppConfigurationImpl;
using nineteen::application::NodeRole;
using namespace std::chrono_literals;

class AppConfigurationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  std::filesystem::path tmp_dir =
      std::filesystem::temp_directory_path()
      / ("nineteen_config_" + std::to_string(::getpid()));
  std::string config_path = (tmp_dir / "config.json").native();
  std::string damaged_config_path = (tmp_dir / "damaged_config.json").native();
  std::string bad_tasks_config_path = (tmp_dir / "bad_tasks.json").native();

  static constexpr char const *file_content =
      R"({
        "general" : {
          "env" : "dev",
          "log" : ["dispatch=debug"],
          "prometheus-port" : 9615
        },
        "storage" : {
          "host" : "db.local",
          "port" : 6543,
          "database" : "validator"
        },
        "cache" : {
          "host" : "redis.local",
          "timeout-ms" : 250
        },
        "chain" : {
          "endpoint" : "http://chain.local:9944",
          "netuid" : 176,
          "sync-interval-ms" : 60000
        },
        "dispatch" : {
          "workers" : 4,
          "queue-capacity" : 100,
          "max-attempts" : 5,
          "backoff-base-ms" : 50,
          "backoff-max-ms" : 800
        },
        "scoring" : {
          "half-life-ms" : 3600000,
          "epoch-length-ms" : 600000,
          "epoch-origin-ms" : 1700000000000
        },
        "gateway" : {
          "port" : 8080,
          "api-keys" : ["k1", "k2"],
          "rate-limit-per-minute" : 10
        },
        "synthetic" : {
          "enabled" : false,
          "scoring-period-multiplier" : 0.5
        },
        "tasks" : [
          { "name" : "chat-llama-3-1-8b", "capacity" : 50, "timeout-ms" : 15000 },
          { "name" : "flux-schnell-text-to-image", "volume-to-requests" : 5,
            "capacity" : 100, "enabled" : false }
        ]
      })";
  static constexpr char const *damaged_file_content =
      R"({
        "general" : {
          "env" : "dev"
        },
        "storage" : "host" : 1
      })";
  static constexpr char const *bad_tasks_file_content =
      R"({ "tasks" : [ { "name" : "a" }, { "name" : "a" } ] })";

  void SetUp() override {
    std::filesystem::create_directories(tmp_dir);
    ASSERT_TRUE(std::filesystem::exists(tmp_dir));

    auto spawn_file = [](const std::string &path,
                         const std::string &content) {
      std::ofstream file(path, std::ofstream::out | std::ofstream::trunc);
      file << content;
    };
    spawn_file(config_path, file_content);
    spawn_file(damaged_config_path, damaged_file_content);
    spawn_file(bad_tasks_config_path, bad_tasks_file_content);

    auto logger = nineteen::log::createLogger("AppConfigTest", "testing");
    app_config_ = std::make_shared<AppConfigurationImpl>(
        logger, [this](const char *name) -> std::optional<std::string> {
          if (auto it = env_.find(name); it != env_.end()) {
            return it->second;
          }
          return std::nullopt;
        });
  }

  void TearDown() override {
    app_config_.reset();
    std::filesystem::remove_all(tmp_dir);
  }

  template <size_t N>
  bool initialize(const char *(&args)[N]) {
    return app_config_->initializeFromArgs(static_cast<int>(N), args);
  }

  static boost::asio::ip::tcp::endpoint get_endpoint(const char *host,
                                                     uint16_t port) {
    return {boost::asio::ip::make_address(host), port};
  }

  std::map<std::string, std::string> env_;
  std::shared_ptr<AppConfigurationImpl> app_config_;
};

/**
 * @given new created AppConfigurationImpl
 * @when only a role is provided
 * @then only default values are available
 */
TEST_F(AppConfigurationTest, DefaultValuesTest) {
  const char *args[] = {"/path/", "query-node"};
  ASSERT_TRUE(initialize(args));

  EXPECT_EQ(app_config_->role(), NodeRole::QueryNode);
  EXPECT_EQ(app_config_->environment(), "prod");
  EXPECT_EQ(app_config_->log(), std::vector<std::string>());
  EXPECT_EQ(app_config_->postgresConfig().host, "localhost");
  EXPECT_EQ(app_config_->postgresConfig().port, 5432);
  EXPECT_EQ(app_config_->redisConfig().port, 6379);
  EXPECT_EQ(app_config_->chainConfig().netuid, 19);
  EXPECT_EQ(app_config_->routerConfig().max_attempts, 3u);
  EXPECT_EQ(app_config_->queueConfig().capacity, 10000u);
  EXPECT_EQ(app_config_->weightsInterval(), 10min);
  EXPECT_TRUE(app_config_->syntheticConfig().enabled);
  EXPECT_TRUE(app_config_->gatewayConfig().api_keys.empty());
  EXPECT_EQ(app_config_->gatewayEndpoint(), std::nullopt);
  EXPECT_EQ(app_config_->openmetricsHttpEndpoint(), std::nullopt);
  ASSERT_EQ(app_config_->taskTypes().size(), 2u);
  EXPECT_EQ(app_config_->taskTypes()[0].name, "chat-llama-3-2-3b");
}

/**
 * @given new created AppConfigurationImpl
 * @when no role, an unknown role or help is requested
 * @then the process should not proceed
 */
TEST_F(AppConfigurationTest, RoleIsRequired) {
  const char *none[] = {"/path/"};
  EXPECT_FALSE(initialize(none));
  const char *unknown[] = {"/path/", "full-node"};
  EXPECT_FALSE(initialize(unknown));
  const char *help[] = {"/path/", "entry-node", "--help"};
  EXPECT_FALSE(initialize(help));
  const char *options_only[] = {"/path/", "--netuid", "19"};
  EXPECT_FALSE(initialize(options_only));
}

TEST_F(AppConfigurationTest, RoleNames) {
  for (auto role : {NodeRole::Migrate,
                    NodeRole::EntryNode,
                    NodeRole::QueryNode,
                    NodeRole::ControlNode,
                    NodeRole::ChainNode}) {
    EXPECT_EQ(nineteen::application::nodeRoleFromString(
                  nineteen::application::toString(role)),
              role);
  }
  EXPECT_EQ(nineteen::application::nodeRoleFromString("validator"),
            std::nullopt);
}

/**
 * @given a configuration file
 * @when it is passed with -c
 * @then every segment is taken from it
 */
TEST_F(AppConfigurationTest, ConfigFileTest) {
  const char *args[] = {"/path/", "control-node", "-c", config_path.c_str()};
  ASSERT_TRUE(initialize(args));

  EXPECT_EQ(app_config_->role(), NodeRole::ControlNode);
  EXPECT_EQ(app_config_->environment(), "dev");
  EXPECT_EQ(app_config_->log(), std::vector<std::string>{"dispatch=debug"});
  EXPECT_EQ(app_config_->openmetricsHttpEndpoint(),
            get_endpoint("0.0.0.0", 9615));

  EXPECT_EQ(app_config_->postgresConfig().host, "db.local");
  EXPECT_EQ(app_config_->postgresConfig().port, 6543);
  EXPECT_EQ(app_config_->postgresConfig().database, "validator");
  EXPECT_EQ(app_config_->redisConfig().host, "redis.local");
  EXPECT_EQ(app_config_->redisConfig().timeout, 250ms);

  EXPECT_EQ(app_config_->chainConfig().endpoint, "http://chain.local:9944");
  EXPECT_EQ(app_config_->chainConfig().netuid, 176);
  EXPECT_EQ(app_config_->syncConfig().interval, 1min);

  EXPECT_EQ(app_config_->routerConfig().workers, 4u);
  EXPECT_EQ(app_config_->queueConfig().capacity, 100u);
  EXPECT_EQ(app_config_->routerConfig().max_attempts, 5u);
  EXPECT_EQ(app_config_->routerConfig().backoff.base, 50ms);
  EXPECT_EQ(app_config_->routerConfig().backoff.max, 800ms);

  EXPECT_EQ(app_config_->scoringConfig().half_life, 1h);
  EXPECT_EQ(app_config_->epochConfig().length, 10min);
  EXPECT_EQ(nineteen::clock::toMillis(app_config_->epochConfig().origin),
            1700000000000);

  EXPECT_EQ(app_config_->gatewayEndpoint(), get_endpoint("0.0.0.0", 8080));
  EXPECT_EQ(app_config_->gatewayConfig().api_keys,
            (std::set<std::string>{"k1", "k2"}));
  EXPECT_EQ(app_config_->gatewayConfig().rate_limit_per_minute, 10);

  EXPECT_FALSE(app_config_->syntheticConfig().enabled);
  EXPECT_DOUBLE_EQ(app_config_->syntheticConfig().scoring_period_multiplier,
                   0.5);

  auto &types = app_config_->taskTypes();
  ASSERT_EQ(types.size(), 2u);
  EXPECT_EQ(types[0].name, "chat-llama-3-1-8b");
  EXPECT_DOUBLE_EQ(types[0].capacity_per_participant, 50.);
  EXPECT_DOUBLE_EQ(types[0].volume_to_requests, 1.);
  EXPECT_EQ(types[0].timeout, 15s);
  EXPECT_TRUE(types[0].enabled);
  EXPECT_EQ(types[1].name, "flux-schnell-text-to-image");
  EXPECT_DOUBLE_EQ(types[1].volume_to_requests, 5.);
  EXPECT_FALSE(types[1].enabled);
}

/**
 * @given a configuration file, environment variables and command line
 * arguments setting the same values
 * @when configuration is read
 * @then command line wins over environment, environment over file
 */
TEST_F(AppConfigurationTest, CrossConfigTest) {
  env_ = {
      {"POSTGRES_HOST", "env-db"},
      {"POSTGRES_PORT", "7000"},
      {"NETUID", "20"},
      {"ENV", "staging"},
      {"GATEWAY_API_KEYS", " e1, e2 ,,"},
  };
  const char *args[] = {"/path/",
                        "chain-node",
                        "--config-file",
                        config_path.c_str(),
                        "--postgres-host",
                        "cli-db",
                        "--netuid",
                        "21"};
  ASSERT_TRUE(initialize(args));

  EXPECT_EQ(app_config_->postgresConfig().host, "cli-db");
  EXPECT_EQ(app_config_->postgresConfig().port, 7000);
  EXPECT_EQ(app_config_->postgresConfig().database, "validator");
  EXPECT_EQ(app_config_->chainConfig().netuid, 21);
  EXPECT_EQ(app_config_->environment(), "staging");
  EXPECT_EQ(app_config_->gatewayConfig().api_keys,
            (std::set<std::string>{"e1", "e2"}));
}

/**
 * @given a gateway port from the environment
 * @when it is a number, `none` or garbage
 * @then the gateway listens there or is switched off
 */
TEST_F(AppConfigurationTest, GatewayPortTest) {
  env_ = {{"ORGANIC_SERVER_PORT", "8181"}};
  const char *args[] = {"/path/", "entry-node", "--gateway-host", "127.0.0.1"};
  ASSERT_TRUE(initialize(args));
  EXPECT_EQ(app_config_->gatewayEndpoint(), get_endpoint("127.0.0.1", 8181));

  for (auto port : {"none", "http", "70000"}) {
    env_ = {{"ORGANIC_SERVER_PORT", port}};
    app_config_ = std::make_shared<AppConfigurationImpl>(
        nineteen::log::createLogger("AppConfigTest", "testing"),
        [this](const char *name) -> std::optional<std::string> {
          if (auto it = env_.find(name); it != env_.end()) {
            return it->second;
          }
          return std::nullopt;
        });
    const char *entry[] = {"/path/", "entry-node"};
    ASSERT_TRUE(initialize(entry)) << port;
    EXPECT_EQ(app_config_->gatewayEndpoint(), std::nullopt) << port;
  }
}

TEST_F(AppConfigurationTest, InvalidEnvironmentPort) {
  env_ = {{"REDIS_PORT", "redis"}};
  const char *args[] = {"/path/", "query-node"};
  EXPECT_FALSE(initialize(args));
}

/**
 * @given damaged or inconsistent configuration
 * @when configuration is read
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, InvalidConfigTest) {
  const char *damaged[] = {"/path/", "query-node", "-c",
                           damaged_config_path.c_str()};
  EXPECT_FALSE(initialize(damaged));

  const char *missing[] = {"/path/", "query-node", "-c",
                           "/nonexistent/config.json"};
  EXPECT_FALSE(initialize(missing));

  const char *duplicate_tasks[] = {"/path/", "query-node", "-c",
                                   bad_tasks_config_path.c_str()};
  EXPECT_FALSE(initialize(duplicate_tasks));

  const char *no_attempts[] = {"/path/", "query-node", "--max-attempts", "0"};
  EXPECT_FALSE(initialize(no_attempts));

  const char *bad_option[] = {"/path/", "query-node", "--netuid", "many"};
  EXPECT_FALSE(initialize(bad_option));
}

/**
 * @given a lease ttl not longer than one worker request and its backoff
 * @when configuration is read
 * @then initialization fails
 */
TEST_F(AppConfigurationTest, LeaseOutlivesRequest) {
  const char *short_lease[] = {"/path/",
                               "query-node",
                               "--request-timeout-ms",
                               "58000"};
  EXPECT_FALSE(initialize(short_lease));

  const char *long_enough[] = {"/path/",
                               "query-node",
                               "--request-timeout-ms",
                               "54000"};
  ASSERT_TRUE(initialize(long_enough));
  EXPECT_EQ(app_config_->routerConfig().request_timeout, 54s);
}
