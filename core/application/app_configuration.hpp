/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>

#include "cache/redis/redis_config.hpp"
#include "chain/chain_sync_agent.hpp"
#include "chain/impl/jrpc_chain_client.hpp"
#include "dispatch/dispatch_router.hpp"
#include "gateway/intake_gateway.hpp"
#include "primitives/task_type.hpp"
#include "scoring/weight_scheduler.hpp"
#include "storage/postgres/pg_connection_pool.hpp"
#include "synthetic/synthetic_scheduler.hpp"

namespace nineteen::application {

  /**
   * Process kinds of a validator deployment
   */
  enum class NodeRole {
    Migrate,      ///< apply schema migrations and exit
    EntryNode,    ///< intake gateway
    QueryNode,    ///< dispatch router
    ControlNode,  ///< scoring, weights and synthetic traffic
    ChainNode,    ///< chain sync agent
  };

  std::string_view toString(NodeRole role);
  std::optional<NodeRole> nodeRoleFromString(std::string_view str);

  /**
   * Configuration of the application
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    virtual NodeRole role() const = 0;

    /// Deployment name, e.g. prod or dev
    virtual const std::string &environment() const = 0;

    /**
     * @return logging system tuning config
     */
    virtual const std::vector<std::string> &log() const = 0;

    /// Logging configuration YAML replacing the embedded one
    virtual const std::optional<std::string> &loggingConfigPath() const = 0;

    virtual const storage::PostgresConfig &postgresConfig() const = 0;
    virtual const cache::RedisConfig &redisConfig() const = 0;

    virtual const chain::ChainConfig &chainConfig() const = 0;
    virtual const chain::SyncConfig &syncConfig() const = 0;

    virtual const dispatch::QueueConfig &queueConfig() const = 0;
    virtual const dispatch::RouterConfig &routerConfig() const = 0;

    virtual const scoring::ScoringConfig &scoringConfig() const = 0;
    virtual const scoring::WeightSetterConfig &weightSetterConfig() const = 0;
    virtual const scoring::EpochConfig &epochConfig() const = 0;

    /// How often scores are recomputed and weights submitted
    virtual std::chrono::milliseconds weightsInterval() const = 0;

    virtual const synthetic::SyntheticConfig &syntheticConfig() const = 0;

    virtual const gateway::GatewayConfig &gatewayConfig() const = 0;

    /// @return nullopt if the gateway is switched off
    virtual std::optional<boost::asio::ip::tcp::endpoint> gatewayEndpoint()
        const = 0;

    /// Number of requests the gateway serves at once
    virtual size_t gatewayThreads() const = 0;

    /**
     * @return endpoint for OpenMetrics over HTTP protocol, nullopt if off
     */
    virtual std::optional<boost::asio::ip::tcp::endpoint>
    openmetricsHttpEndpoint() const = 0;

    /// Kinds of work the subnet serves
    virtual const std::vector<primitives::TaskType> &taskTypes() const = 0;
  };

}  // namespace nineteen::application
