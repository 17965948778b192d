/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

#include <boost/program_options.hpp>

namespace nineteen::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::string embedded_config(R"(
# ----------------
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: libp2p
        level: off
      - name: nineteen
        children:
          - name: injector
          - name: application
          - name: storage
            children:
              - name: postgres
              - name: migrations
          - name: cache
            children:
              - name: redis
          - name: http
          - name: chain
          - name: dispatch
          - name: scoring
          - name: gateway
          - name: synthetic
          - name: metrics
          - name: threads
      - name: others
        children:
          - name: testing
          - name: debug
# ----------------
  )");
  }  // namespace

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous)
      : ConfiguratorFromYAML(std::move(previous), embedded_config) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous,
                             std::string config)
      : ConfiguratorFromYAML(std::move(previous), std::move(config)) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous,
                             std::filesystem::path path)
      : ConfiguratorFromYAML(std::move(previous), std::move(path)) {}

  std::optional<std::filesystem::path> Configurator::getLogConfigFile(
      int argc, const char **argv) {
    namespace po = boost::program_options;
    po::options_description desc("General options");
    desc.add_options()
        // clang-format off
        ("logcfg", po::value<std::string>())
        ("log", po::value<std::vector<std::string>>())  // needed to avoid mix `--logcfg` and `--log`
        // clang-format on
        ;

    po::variables_map vm;

    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(desc)
                                    .allow_unregistered()
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    if (auto it = vm.find("logcfg"); it != vm.end()) {
      if (not it->second.defaulted()) {
        return it->second.as<std::string>();
      }
    }
    return std::nullopt;
  }

}  // namespace nineteen::log
