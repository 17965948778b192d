/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nineteen::http {

  enum class HttpError {
    INVALID_URI = 1,
    RESOLVE_FAILED,
    CONNECTION_FAILED,
    SEND_FAILED,
    RECEIVE_FAILED,
    TIMEOUT,
  };

}  // namespace nineteen::http

OUTCOME_HPP_DECLARE_ERROR(nineteen::http, HttpError);
