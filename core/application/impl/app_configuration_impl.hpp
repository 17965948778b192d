/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <cstdio>
#include <functional>
#include <memory>

#include <rapidjson/document.h>

#include "log/logger.hpp"

#ifdef DECLARE_PROPERTY
#error DECLARE_PROPERTY already defined!
#endif  // DECLARE_PROPERTY
#define DECLARE_PROPERTY(T, N)                                                 \
 private:                                                                      \
  T N##_;                                                                      \
                                                                               \
 public:                                                                       \
  std::conditional<std::is_trivial<T>::value && (sizeof(T) <= sizeof(size_t)), \
                   T,                                                          \
                   const T &>::type                                            \
  N() const override {                                                         \
    return N##_;                                                               \
  }

namespace nineteen::application {

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *      ENVIRONMENT VARIABLES
   *                V
   *        CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on

  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    using Environment =
        std::function<std::optional<std::string>(const char *name)>;

    explicit AppConfigurationImpl(log::Logger logger);

    /// \param environment replaces the process environment
    AppConfigurationImpl(log::Logger logger, Environment environment);

    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * Parses `<program> <role> [options]`
     * @return false if the process should not proceed
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    NodeRole role() const override {
      return role_;
    }
    const std::string &environment() const override {
      return environment_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }
    const std::optional<std::string> &loggingConfigPath() const override {
      return logging_config_path_;
    }
    const storage::PostgresConfig &postgresConfig() const override {
      return postgres_;
    }
    const cache::RedisConfig &redisConfig() const override {
      return redis_;
    }
    const chain::ChainConfig &chainConfig() const override {
      return chain_;
    }
    const chain::SyncConfig &syncConfig() const override {
      return sync_;
    }
    const dispatch::QueueConfig &queueConfig() const override {
      return queue_;
    }
    const dispatch::RouterConfig &routerConfig() const override {
      return router_;
    }
    const scoring::ScoringConfig &scoringConfig() const override {
      return scoring_;
    }
    const scoring::WeightSetterConfig &weightSetterConfig() const override {
      return weight_setter_;
    }
    const scoring::EpochConfig &epochConfig() const override {
      return epoch_;
    }
    const synthetic::SyntheticConfig &syntheticConfig() const override {
      return synthetic_;
    }
    const gateway::GatewayConfig &gatewayConfig() const override {
      return gateway_;
    }
    std::optional<boost::asio::ip::tcp::endpoint> gatewayEndpoint()
        const override;
    std::optional<boost::asio::ip::tcp::endpoint> openmetricsHttpEndpoint()
        const override;
    const std::vector<primitives::TaskType> &taskTypes() const override {
      return task_types_;
    }

    DECLARE_PROPERTY(std::chrono::milliseconds, weightsInterval);
    DECLARE_PROPERTY(size_t, gatewayThreads);

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_storage_segment(const rapidjson::Value &val);
    void parse_cache_segment(const rapidjson::Value &val);
    void parse_chain_segment(const rapidjson::Value &val);
    void parse_dispatch_segment(const rapidjson::Value &val);
    void parse_scoring_segment(const rapidjson::Value &val);
    void parse_gateway_segment(const rapidjson::Value &val);
    void parse_synthetic_segment(const rapidjson::Value &val);
    bool parse_tasks_segment(const rapidjson::Value &val);

    bool read_config_from_file(const std::string &filepath);
    bool read_environment();
    bool validate_config();

    /// Enables or disables the gateway by a port value, `none` disables it
    void set_gateway_port(std::string_view value);

    FilePtr open_file(const std::string &filepath);

    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_bool(const rapidjson::Value &val, const char *name, bool &target);
    bool load_u16(const rapidjson::Value &val,
                  const char *name,
                  uint16_t &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);
    bool load_i64(const rapidjson::Value &val,
                  const char *name,
                  int64_t &target);
    bool load_double(const rapidjson::Value &val,
                     const char *name,
                     double &target);
    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::chrono::milliseconds &target);
    bool load_strings(const rapidjson::Value &val,
                      const char *name,
                      std::vector<std::string> &target);

    log::Logger logger_;
    Environment get_env_;

    NodeRole role_{NodeRole::QueryNode};
    std::string environment_{"prod"};
    std::vector<std::string> logger_tuning_config_;
    std::optional<std::string> logging_config_path_;

    storage::PostgresConfig postgres_;
    cache::RedisConfig redis_;
    chain::ChainConfig chain_;
    chain::SyncConfig sync_;
    dispatch::QueueConfig queue_;
    dispatch::RouterConfig router_;
    scoring::ScoringConfig scoring_;
    scoring::WeightSetterConfig weight_setter_;
    scoring::EpochConfig epoch_;
    synthetic::SyntheticConfig synthetic_;
    gateway::GatewayConfig gateway_;
    std::vector<primitives::TaskType> task_types_;

    std::string gateway_host_{"0.0.0.0"};
    std::optional<uint16_t> gateway_port_;
    std::string openmetrics_http_host_{"0.0.0.0"};
    std::optional<uint16_t> openmetrics_http_port_;
  };

}  // namespace nineteen::application

#undef DECLARE_PROPERTY
