/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "outcome/outcome.hpp"

namespace nineteen::common {

  enum class UriError {
    EMPTY = 1,
    INVALID_SCHEME,
    INVALID_HOST,
    INVALID_PORT,
  };

  /// Absolute url of a worker or chain endpoint, e.g. http://10.0.0.1:8091/x
  struct Uri {
    std::string scheme;
    /// IPv6 literal is kept without brackets
    std::string host;
    std::optional<uint16_t> port;
    std::string path;
    std::string query;

    static outcome::result<Uri> parse(std::string_view url);

    /// Path with query, as sent in the request line
    std::string target() const;
  };

}  // namespace nineteen::common

OUTCOME_HPP_DECLARE_ERROR(nineteen::common, UriError);
