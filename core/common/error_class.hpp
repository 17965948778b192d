/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <system_error>

namespace nineteen {

  /**
   * How an error is handled by the pipeline:
   * - Validation: bad input, never retried
   * - TransientIO: network or store hiccup, retried with backoff up to a bound
   * - ResourceExhausted: backpressure, surfaced to the caller immediately
   * - ConsistencyViolation: resolved as success and logged
   * - Fatal: the process exits and the restart policy takes over
   */
  enum class ErrorClass {
    Validation,
    TransientIO,
    ResourceExhausted,
    ConsistencyViolation,
    Fatal,
  };

  ErrorClass classify(const std::error_code &ec);

  inline bool isTransient(const std::error_code &ec) {
    return classify(ec) == ErrorClass::TransientIO;
  }

  std::string_view toString(ErrorClass error_class);

}  // namespace nineteen
