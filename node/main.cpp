/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>
#include <soralog/util.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/nineteen_application_impl.hpp"
#include "injector/application_injector.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

using nineteen::application::AppConfigurationImpl;

namespace {
  int run_node(int argc, const char **argv) {
    auto configuration = std::make_shared<AppConfigurationImpl>(
        nineteen::log::createLogger("AppConfiguration", "application"));

    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    if (auto res = nineteen::log::tuneLoggingSystem(configuration->log());
        res.has_error()) {
      std::cerr << "Wrong `-l` option: " << res.error().message() << '\n';
      return EXIT_FAILURE;
    }

    auto injector =
        std::make_unique<nineteen::injector::NineteenNodeInjector>(
            configuration);

    auto app = std::make_shared<nineteen::application::NineteenApplicationImpl>(
        *injector);

    auto logger =
        nineteen::log::createLogger("Main", nineteen::log::defaultGroupName);

    auto exit_code = app->run();

    SL_INFO(logger,
            "Node {} exited with code {}",
            toString(configuration->role()),
            exit_code);
    logger->flush();

    return exit_code;
  }

  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Available subcommands: migrate entry-node query-node "
                 "control-node chain-node\n"
                 "Run with `--help' argument to print usage\n";
  }

}  // namespace

int main(int argc, const char **argv) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  setvbuf(stderr, nullptr, _IOLBF, 0);

  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc < 2) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  soralog::util::setThreadName("nineteen");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        nineteen::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto nineteen_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<nineteen::log::Configurator>(
                  std::move(libp2p_log_configurator),
                  custom_log_config_path.value())
            : std::make_shared<nineteen::log::Configurator>(
                  std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(nineteen_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  nineteen::log::setLoggingSystem(logging_system);

  int exit_code = EXIT_FAILURE;

  std::string_view name{argv[1]};
  if (name.substr(0, 1) == "-"
      and name != "-h"
      and name != "--help") {
    // Options are given before a subcommand
    wrong_usage();
  } else {
    exit_code = run_node(argc, argv);
  }

  auto logger =
      nineteen::log::createLogger("Main", nineteen::log::defaultGroupName);
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
