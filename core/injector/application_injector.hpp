/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "clock/clock.hpp"

namespace nineteen {
  namespace application {
    class AppConfiguration;
    class AppStateManager;
  }  // namespace application

  namespace storage::migrations {
    class Migrator;
  }

  namespace chain {
    class ChainSyncAgent;
  }

  namespace dispatch {
    class DispatchRouter;
  }

  namespace scoring {
    class WeightScheduler;
  }

  namespace synthetic {
    class SyntheticScheduler;
  }

  namespace gateway {
    class IntakeGateway;
  }

  namespace http {
    class Server;
  }
}  // namespace nineteen

namespace nineteen::injector {

  /**
   * Dependency injector of every node role. Components are created lazily,
   * so a role instantiates only what it asks for.
   */
  class NineteenNodeInjector final {
   public:
    explicit NineteenNodeInjector(
        std::shared_ptr<application::AppConfiguration> app_config);

    std::shared_ptr<application::AppConfiguration> injectAppConfig();
    std::shared_ptr<application::AppStateManager> injectAppStateManager();
    std::shared_ptr<clock::SystemClock> injectSystemClock();
    std::shared_ptr<storage::migrations::Migrator> injectMigrator();

    std::shared_ptr<chain::ChainSyncAgent> injectChainSyncAgent();
    std::shared_ptr<dispatch::DispatchRouter> injectDispatchRouter();
    std::shared_ptr<scoring::WeightScheduler> injectWeightScheduler();
    std::shared_ptr<synthetic::SyntheticScheduler> injectSyntheticScheduler();
    std::shared_ptr<gateway::IntakeGateway> injectIntakeGateway();

    /// Listener of the gateway API, nullptr when no port is configured
    std::shared_ptr<http::Server> injectGatewayServer();

    /// Listener of OpenMetrics scrapes, nullptr when no port is configured
    std::shared_ptr<http::Server> injectOpenMetricsService();

   protected:
    std::shared_ptr<class NineteenNodeInjectorImpl> pimpl_;
  };

}  // namespace nineteen::injector
