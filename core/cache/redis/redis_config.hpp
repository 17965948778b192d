/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace nineteen::cache {

  struct RedisConfig {
    std::string host{"localhost"};
    uint16_t port{6379};
    std::string password;
    uint32_t database{0};

    /// Limit of connect and of every command round trip
    std::chrono::milliseconds timeout{std::chrono::seconds(5)};

    /// Size of the connection pool shared by all callers
    size_t max_idle_connections{4};
  };

}  // namespace nineteen::cache
