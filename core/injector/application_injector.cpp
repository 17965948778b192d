/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "injector/application_injector.hpp"

#define BOOST_DI_CFG_DIAGNOSTICS_LEVEL 2
#define BOOST_DI_CFG_CTOR_LIMIT_SIZE 16

#include <boost/di.hpp>
#include <boost/di/extension/scopes/shared.hpp>

#include "application/app_configuration.hpp"
#include "application/impl/app_state_manager_impl.hpp"
#include "cache/lease_manager.hpp"
#include "cache/redis/redis_cache.hpp"
#include "chain/chain_sync_agent.hpp"
#include "chain/impl/jrpc_chain_client.hpp"
#include "clock/impl/clock_impl.hpp"
#include "clock/impl/ticker_impl.hpp"
#include "dispatch/dispatch_router.hpp"
#include "dispatch/impl/http_worker_client.hpp"
#include "dispatch/participant_selector.hpp"
#include "dispatch/task_queue.hpp"
#include "gateway/impl/gateway_http_handler.hpp"
#include "gateway/intake_gateway.hpp"
#include "gateway/result_waiter.hpp"
#include "http/impl/http_client_impl.hpp"
#include "http/server.hpp"
#include "injector/bind_shared.hpp"
#include "metrics/impl/handler_impl.hpp"
#include "scoring/scoring_engine.hpp"
#include "scoring/weight_scheduler.hpp"
#include "scoring/weight_setter.hpp"
#include "storage/migrations/migrations.hpp"
#include "storage/postgres/pg_connection_pool.hpp"
#include "storage/postgres/pg_outcome_repository.hpp"
#include "storage/postgres/pg_participant_repository.hpp"
#include "storage/postgres/pg_score_repository.hpp"
#include "storage/postgres/pg_task_repository.hpp"
#include "storage/postgres/pg_weight_submission_repository.hpp"
#include "synthetic/synthetic_scheduler.hpp"
#include "utils/thread_pool.hpp"

namespace {
  template <class T>
  using sptr = std::shared_ptr<T>;

  namespace di = boost::di;
  using namespace nineteen;  // NOLINT

  using injector::bindShared;

  /// Pool running the timers of periodic components
  struct TimerThreadPool : ThreadPool {
    TimerThreadPool() : ThreadPool("timers", 1) {}
  };

  template <typename Injector>
  const application::AppConfiguration &appConfig(const Injector &injector) {
    return injector.template create<const application::AppConfiguration &>();
  }

  template <typename Injector>
  sptr<clock::Ticker> makeTicker(const Injector &injector,
                                 std::chrono::milliseconds interval) {
    auto timers = injector.template create<sptr<TimerThreadPool>>();
    return std::make_shared<clock::TickerImpl>(timers->io_context(), interval);
  }

  sptr<http::Server> makeServer(std::string_view name,
                                const boost::asio::ip::tcp::endpoint &endpoint,
                                sptr<http::RequestHandler> handler) {
    http::Server::Configuration config{.endpoint = endpoint};
    return std::make_shared<http::Server>(
        name, std::move(config), std::move(handler));
  }

  template <typename... Ts>
  auto makeNodeInjector(sptr<application::AppConfiguration> config,
                        Ts &&...args) {
    return di::make_injector(
        di::bind<application::AppConfiguration>.to(config),
        di::bind<application::AppStateManager>.template to<application::AppStateManagerImpl>(),
        di::bind<clock::SystemClock>.template to<clock::SystemClockImpl>(),
        bindShared<TimerThreadPool>([](const auto &) {
          return std::make_shared<TimerThreadPool>();
        }),

        // state store
        bindShared<storage::PgConnectionPool>([](const auto &injector) {
          return std::make_shared<storage::PgConnectionPool>(
              appConfig(injector).postgresConfig());
        }),
        di::bind<storage::migrations::Migrator>.template to<storage::migrations::Migrator>(),
        di::bind<storage::ParticipantRepository>.template to<storage::PgParticipantRepository>(),
        di::bind<storage::TaskRepository>.template to<storage::PgTaskRepository>(),
        di::bind<storage::OutcomeRepository>.template to<storage::PgOutcomeRepository>(),
        di::bind<storage::ScoreRepository>.template to<storage::PgScoreRepository>(),
        di::bind<storage::WeightSubmissionRepository>.template to<storage::PgWeightSubmissionRepository>(),

        // coordination cache
        bindShared<cache::CoordinationCache>([](const auto &injector) {
          return sptr<cache::CoordinationCache>(
              std::make_shared<cache::RedisCache>(
                  appConfig(injector).redisConfig()));
        }),
        bindShared<cache::LeaseManager>([](const auto &injector) {
          return std::make_shared<cache::LeaseManager>(
              injector.template create<sptr<cache::CoordinationCache>>());
        }),

        // external collaborators
        di::bind<http::HttpClient>.template to<http::HttpClientImpl>(),
        bindShared<chain::ChainClient>([](const auto &injector) {
          return sptr<chain::ChainClient>(
              std::make_shared<chain::JrpcChainClient>(
                  appConfig(injector).chainConfig(),
                  injector.template create<sptr<http::HttpClient>>()));
        }),
        bindShared<dispatch::WorkerClient>([](const auto &injector) {
          return sptr<dispatch::WorkerClient>(
              std::make_shared<dispatch::HttpWorkerClient>(
                  injector.template create<sptr<http::HttpClient>>()));
        }),

        // chain sync
        bindShared<chain::ChainSyncAgent>([](const auto &injector) {
          auto &config = appConfig(injector);
          return std::make_shared<chain::ChainSyncAgent>(
              injector.template create<application::AppStateManager &>(),
              config.syncConfig(),
              injector.template create<sptr<chain::ChainClient>>(),
              injector.template create<sptr<storage::ParticipantRepository>>(),
              injector.template create<sptr<cache::CoordinationCache>>(),
              injector.template create<sptr<cache::LeaseManager>>(),
              injector.template create<sptr<clock::SystemClock>>(),
              makeTicker(injector, config.syncConfig().interval));
        }),

        // scoring
        bindShared<scoring::ScoringEngine>([](const auto &injector) {
          return std::make_shared<scoring::ScoringEngine>(
              appConfig(injector).scoringConfig(),
              injector.template create<sptr<storage::OutcomeRepository>>(),
              injector.template create<sptr<storage::ParticipantRepository>>(),
              injector.template create<sptr<storage::ScoreRepository>>(),
              injector.template create<sptr<clock::SystemClock>>());
        }),
        bindShared<scoring::WeightSetter>([](const auto &injector) {
          return std::make_shared<scoring::WeightSetter>(
              appConfig(injector).weightSetterConfig(),
              injector.template create<sptr<chain::ChainClient>>(),
              injector.template create<sptr<storage::ParticipantRepository>>(),
              injector.template create<sptr<storage::ScoreRepository>>(),
              injector
                  .template create<sptr<storage::WeightSubmissionRepository>>(),
              injector.template create<sptr<clock::SystemClock>>());
        }),
        bindShared<scoring::WeightScheduler>([](const auto &injector) {
          auto &config = appConfig(injector);
          return std::make_shared<scoring::WeightScheduler>(
              injector.template create<application::AppStateManager &>(),
              config.epochConfig(),
              injector.template create<sptr<scoring::ScoringEngine>>(),
              injector.template create<sptr<scoring::WeightSetter>>(),
              injector.template create<sptr<clock::SystemClock>>(),
              makeTicker(injector, config.weightsInterval()));
        }),

        // dispatch
        bindShared<dispatch::TaskQueue>([](const auto &injector) {
          return std::make_shared<dispatch::TaskQueue>(
              appConfig(injector).queueConfig(),
              injector.template create<sptr<storage::TaskRepository>>(),
              injector.template create<sptr<cache::CoordinationCache>>(),
              injector.template create<sptr<clock::SystemClock>>());
        }),
        bindShared<dispatch::ParticipantSelector>([](const auto &) {
          return std::make_shared<dispatch::ParticipantSelector>(
              dispatch::ParticipantSelector::Config{});
        }),
        bindShared<dispatch::DispatchRouter>([](const auto &injector) {
          return std::make_shared<dispatch::DispatchRouter>(
              injector.template create<application::AppStateManager &>(),
              appConfig(injector).routerConfig(),
              injector.template create<sptr<dispatch::TaskQueue>>(),
              injector.template create<sptr<storage::TaskRepository>>(),
              injector.template create<sptr<storage::ParticipantRepository>>(),
              injector.template create<sptr<storage::ScoreRepository>>(),
              injector.template create<sptr<scoring::ScoringEngine>>(),
              injector.template create<sptr<dispatch::WorkerClient>>(),
              injector.template create<sptr<cache::CoordinationCache>>(),
              injector.template create<sptr<cache::LeaseManager>>(),
              injector.template create<sptr<clock::SystemClock>>(),
              injector.template create<sptr<dispatch::ParticipantSelector>>());
        }),

        // synthetic traffic
        bindShared<synthetic::SyntheticScheduler>([](const auto &injector) {
          auto &config = appConfig(injector);
          return std::make_shared<synthetic::SyntheticScheduler>(
              injector.template create<application::AppStateManager &>(),
              config.syntheticConfig(),
              config.taskTypes(),
              injector.template create<sptr<dispatch::TaskQueue>>(),
              injector.template create<sptr<storage::ParticipantRepository>>(),
              injector.template create<sptr<cache::CoordinationCache>>(),
              injector.template create<sptr<clock::SystemClock>>());
        }),

        // gateway
        bindShared<gateway::ResultWaiter>([](const auto &injector) {
          return std::make_shared<gateway::ResultWaiter>(
              injector.template create<sptr<cache::CoordinationCache>>());
        }),
        bindShared<gateway::IntakeGateway>([](const auto &injector) {
          auto &config = appConfig(injector);
          return std::make_shared<gateway::IntakeGateway>(
              config.gatewayConfig(),
              config.taskTypes(),
              injector.template create<sptr<dispatch::TaskQueue>>(),
              injector.template create<sptr<cache::CoordinationCache>>(),
              injector.template create<sptr<gateway::ResultWaiter>>(),
              injector.template create<sptr<clock::SystemClock>>());
        }),
        bindShared<gateway::GatewayHttpHandler>([](const auto &injector) {
          return std::make_shared<gateway::GatewayHttpHandler>(
              injector.template create<sptr<gateway::IntakeGateway>>(),
              appConfig(injector).gatewayThreads());
        }),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
  }
}  // namespace

namespace nineteen::injector {

  class NineteenNodeInjectorImpl {
   public:
    using Injector =
        decltype(makeNodeInjector(sptr<application::AppConfiguration>()));

    explicit NineteenNodeInjectorImpl(Injector injector)
        : injector_{std::move(injector)} {}
    Injector injector_;
  };

  NineteenNodeInjector::NineteenNodeInjector(
      sptr<application::AppConfiguration> app_config)
      : pimpl_{std::make_unique<NineteenNodeInjectorImpl>(
            makeNodeInjector(std::move(app_config)))} {}

  sptr<application::AppConfiguration> NineteenNodeInjector::injectAppConfig() {
    return pimpl_->injector_
        .template create<sptr<application::AppConfiguration>>();
  }

  sptr<application::AppStateManager>
  NineteenNodeInjector::injectAppStateManager() {
    return pimpl_->injector_
        .template create<sptr<application::AppStateManager>>();
  }

  sptr<clock::SystemClock> NineteenNodeInjector::injectSystemClock() {
    return pimpl_->injector_.template create<sptr<clock::SystemClock>>();
  }

  sptr<storage::migrations::Migrator> NineteenNodeInjector::injectMigrator() {
    return pimpl_->injector_
        .template create<sptr<storage::migrations::Migrator>>();
  }

  sptr<chain::ChainSyncAgent> NineteenNodeInjector::injectChainSyncAgent() {
    return pimpl_->injector_.template create<sptr<chain::ChainSyncAgent>>();
  }

  sptr<dispatch::DispatchRouter> NineteenNodeInjector::injectDispatchRouter() {
    return pimpl_->injector_.template create<sptr<dispatch::DispatchRouter>>();
  }

  sptr<scoring::WeightScheduler> NineteenNodeInjector::injectWeightScheduler() {
    return pimpl_->injector_.template create<sptr<scoring::WeightScheduler>>();
  }

  sptr<synthetic::SyntheticScheduler>
  NineteenNodeInjector::injectSyntheticScheduler() {
    return pimpl_->injector_
        .template create<sptr<synthetic::SyntheticScheduler>>();
  }

  sptr<gateway::IntakeGateway> NineteenNodeInjector::injectIntakeGateway() {
    return pimpl_->injector_.template create<sptr<gateway::IntakeGateway>>();
  }

  sptr<http::Server> NineteenNodeInjector::injectGatewayServer() {
    auto endpoint = injectAppConfig()->gatewayEndpoint();
    if (not endpoint) {
      return nullptr;
    }
    auto handler =
        pimpl_->injector_.template create<sptr<gateway::GatewayHttpHandler>>();
    return makeServer("Gateway", *endpoint, std::move(handler));
  }

  sptr<http::Server> NineteenNodeInjector::injectOpenMetricsService() {
    auto endpoint = injectAppConfig()->openmetricsHttpEndpoint();
    if (not endpoint) {
      return nullptr;
    }
    return makeServer(
        "OpenMetrics", *endpoint, std::make_shared<metrics::HandlerImpl>());
  }

}  // namespace nineteen::injector
