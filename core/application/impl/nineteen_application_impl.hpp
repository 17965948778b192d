/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/nineteen_application.hpp"

#include <functional>
#include <memory>

#include "application/app_configuration.hpp"
#include "log/logger.hpp"

namespace nineteen::injector {
  class NineteenNodeInjector;
}

namespace nineteen::http {
  class Server;
}

namespace nineteen::application {
  class AppStateManager;

  class NineteenApplicationImpl final : public NineteenApplication {
   public:
    explicit NineteenApplicationImpl(injector::NineteenNodeInjector &injector);

    int migrate() override;

    int run() override;

   private:
    /// Intake gateway, nothing to do without a gateway port
    int entryNode();

    /// Dispatch router
    int queryNode();

    /// Weight scheduler and synthetic scheduler
    int controlNode();

    /// Chain sync agent
    int chainNode();

    /**
     * Checks the schema, lets \param inject create the role components and
     * runs them until a shutdown signal
     */
    int runNode(const std::function<bool(AppStateManager &)> &inject);

    static void serve(AppStateManager &app_state_manager,
                      std::shared_ptr<http::Server> server);

    void registerMetrics();

    injector::NineteenNodeInjector &injector_;

    std::shared_ptr<AppConfiguration> app_config_;

    log::Logger logger_;
  };

}  // namespace nineteen::application
