/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "http/http_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nineteen::http, HttpError, e) {
  using E = nineteen::http::HttpError;
  switch (e) {
    case E::INVALID_URI:
      return "Invalid URI";
    case E::RESOLVE_FAILED:
      return "Can't resolve hostname";
    case E::CONNECTION_FAILED:
      return "Connection failed";
    case E::SEND_FAILED:
      return "Request sending failed";
    case E::RECEIVE_FAILED:
      return "Response reception failed";
    case E::TIMEOUT:
      return "Request timed out";
  }
  return "Unknown http error";
}
