/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

namespace nineteen::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  enum class Error : uint8_t {
    WRONG_LEVEL = 1,
    WRONG_GROUP,
    MALFORMED_TUNING,
  };

  /// Root of the groups of every module
  inline const std::string defaultGroupName{"nineteen"};

  /// Level by name, e.g. "debug" or "warn"
  outcome::result<Level> str2lvl(std::string_view str);

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies `-l` options: "<level>" for the whole tree or
   * "<group>=<level>" for one group and its children
   */
  outcome::result<void> tuneLoggingSystem(const std::vector<std::string> &cfg);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace nineteen::log

OUTCOME_HPP_DECLARE_ERROR(nineteen::log, Error);
