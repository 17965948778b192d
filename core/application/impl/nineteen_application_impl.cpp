/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/nineteen_application_impl.hpp"

#include <cstdlib>

#include <unistd.h>
#include <boost/assert.hpp>

#include "application/app_state_manager.hpp"
#include "chain/chain_sync_agent.hpp"
#include "dispatch/dispatch_router.hpp"
#include "gateway/intake_gateway.hpp"
#include "http/server.hpp"
#include "injector/application_injector.hpp"
#include "metrics/metrics.hpp"
#include "scoring/weight_scheduler.hpp"
#include "storage/migrations/migrations.hpp"
#include "synthetic/synthetic_scheduler.hpp"

namespace nineteen::application {

  NineteenApplicationImpl::NineteenApplicationImpl(
      injector::NineteenNodeInjector &injector)
      : injector_(injector),
        logger_(log::createLogger("Application", "application")) {
    app_config_ = injector_.injectAppConfig();
    BOOST_ASSERT(app_config_ != nullptr);
  }

  int NineteenApplicationImpl::migrate() {
    auto migrator = injector_.injectMigrator();
    auto res = migrator->migrate();
    if (res.has_error()) {
      SL_CRITICAL(
          logger_, "Failed to migrate the database: {}", res.error().message());
      return EXIT_FAILURE;
    }
    SL_INFO(logger_, "Database schema is at version {}", res.value());
    return EXIT_SUCCESS;
  }

  int NineteenApplicationImpl::run() {
    switch (app_config_->role()) {
      case NodeRole::Migrate:
        return migrate();
      case NodeRole::EntryNode:
        return entryNode();
      case NodeRole::QueryNode:
        return queryNode();
      case NodeRole::ControlNode:
        return controlNode();
      case NodeRole::ChainNode:
        return chainNode();
    }
    return EXIT_FAILURE;
  }

  int NineteenApplicationImpl::entryNode() {
    if (not app_config_->gatewayEndpoint()) {
      SL_INFO(logger_, "Gateway API is switched off, entry node is idle");
      return EXIT_SUCCESS;
    }
    return runNode([this](AppStateManager &app_state_manager) {
      auto gateway = injector_.injectIntakeGateway();
      app_state_manager.atPrepare([gateway] { return gateway->prepare(); });
      serve(app_state_manager, injector_.injectGatewayServer());
      return true;
    });
  }

  int NineteenApplicationImpl::queryNode() {
    return runNode([this](AppStateManager &) {
      return injector_.injectDispatchRouter() != nullptr;
    });
  }

  int NineteenApplicationImpl::controlNode() {
    return runNode([this](AppStateManager &) {
      return injector_.injectWeightScheduler() != nullptr
         and injector_.injectSyntheticScheduler() != nullptr;
    });
  }

  int NineteenApplicationImpl::chainNode() {
    return runNode([this](AppStateManager &) {
      return injector_.injectChainSyncAgent() != nullptr;
    });
  }

  int NineteenApplicationImpl::runNode(
      const std::function<bool(AppStateManager &)> &inject) {
    auto app_state_manager = injector_.injectAppStateManager();

    // Registered before any component so it runs first
    app_state_manager->atPrepare([this, migrator{injector_.injectMigrator()}] {
      if (auto res = migrator->ensureVersion(); res.has_error()) {
        SL_CRITICAL(logger_,
                    "Database is not ready: {}. Run `nineteen migrate` first",
                    res.error().message());
        return false;
      }
      return true;
    });

    if (not inject(*app_state_manager)) {
      SL_CRITICAL(logger_, "Can't create components of {}",
                  toString(app_config_->role()));
      return EXIT_FAILURE;
    }

    if (auto server = injector_.injectOpenMetricsService()) {
      serve(*app_state_manager, std::move(server));
    }
    registerMetrics();

    SL_INFO(logger_,
            "Start as {} in {} with PID {}",
            toString(app_config_->role()),
            app_config_->environment(),
            getpid());

    app_state_manager->run();

    if (app_state_manager->failed()) {
      SL_ERROR(logger_, "{} stopped after a failure",
               toString(app_config_->role()));
      return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
  }

  void NineteenApplicationImpl::serve(AppStateManager &app_state_manager,
                                      std::shared_ptr<http::Server> server) {
    BOOST_ASSERT(server != nullptr);
    app_state_manager.atPrepare([server] { return server->prepare(); });
    app_state_manager.atLaunch([server] { return server->start(); });
    app_state_manager.atShutdown([server] { server->stop(); });
  }

  void NineteenApplicationImpl::registerMetrics() {
    auto system_clock = injector_.injectSystemClock();
    auto metrics_registry = metrics::createRegistry();

    constexpr auto startTimeMetricName = "nineteen_process_start_time_seconds";
    metrics_registry->registerGaugeFamily(
        startTimeMetricName,
        "UNIX timestamp of the moment the process started");
    auto metric_start_time =
        metrics_registry->registerGaugeMetric(startTimeMetricName);
    metric_start_time->set(
        static_cast<double>(clock::toMillis(system_clock->now()) / 1000));

    constexpr auto nodeRoleMetricName = "nineteen_node_role";
    metrics_registry->registerGaugeFamily(
        nodeRoleMetricName,
        "A metric with a constant '1' value labeled by role, environment");
    auto metric_node_role = metrics_registry->registerGaugeMetric(
        nodeRoleMetricName,
        {{"role", std::string(toString(app_config_->role()))},
         {"env", app_config_->environment()}});
    metric_node_role->set(1);
  }

}  // namespace nineteen::application
