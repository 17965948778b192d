/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

#include <boost/assert.hpp>
#include <libp2p/log/logger.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(nineteen::log, Error, e) {
  using E = nineteen::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
    case E::WRONG_GROUP:
      return "Unknown log group";
    case E::MALFORMED_TUNING:
      return "Log tuning is not <level> or <group>=<level>";
  }
  return "Unknown log::Error";
}

namespace nineteen::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "nineteen::log::setLoggingSystem() must be called "
                       "before any logger is created");
      return logging_system;
    }

    constexpr std::array<std::pair<std::string_view, Level>, 14> kLevels{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
        {"no", Level::OFF},
        {"none", Level::OFF},
    }};
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevels) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
    libp2p::log::setLoggingSystem(logging_system_.lock());
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &cfg) {
    auto logging_system = loggingSystem();

    for (std::string_view chunk : cfg) {
      auto eq = chunk.find('=');
      if (eq == std::string_view::npos) {
        OUTCOME_TRY(level, str2lvl(chunk));
        logging_system->setLevelOfGroup(defaultGroupName, level);
        continue;
      }

      std::string group{chunk.substr(0, eq)};
      auto level_name = chunk.substr(eq + 1);
      if (group.empty() or level_name.empty()) {
        return Error::MALFORMED_TUNING;
      }
      if (not logging_system->getGroup(group)) {
        return Error::WRONG_GROUP;
      }
      OUTCOME_TRY(level, str2lvl(level_name));
      logging_system->setLevelOfGroup(group, level);
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem())
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

}  // namespace nineteen::log
