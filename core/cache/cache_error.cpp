/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cache/cache_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nineteen::cache, CacheError, e) {
  using E = nineteen::cache::CacheError;
  switch (e) {
    case E::CONNECTION_FAILED:
      return "Connection to the coordination cache failed";
    case E::TIMEOUT:
      return "Coordination cache operation timed out";
    case E::PROTOCOL_ERROR:
      return "Malformed reply from the coordination cache";
    case E::SERVER_ERROR:
      return "Coordination cache replied with error";
    case E::LIST_FULL:
      return "List reached its capacity";
    case E::UNEXPECTED_REPLY:
      return "Coordination cache reply has unexpected type";
  }
  return "Unknown cache error";
}
