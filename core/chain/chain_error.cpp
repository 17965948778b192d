/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/chain_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nineteen::chain, ChainError, e) {
  using E = nineteen::chain::ChainError;
  switch (e) {
    case E::BAD_RESPONSE:
      return "Chain interface returned malformed response";
    case E::RPC_ERROR:
      return "Chain interface returned error";
    case E::REJECTED:
      return "Chain interface rejected the request";
  }
  return "Unknown chain error";
}

OUTCOME_CPP_DEFINE_CATEGORY(nineteen::chain, SyncError, e) {
  using E = nineteen::chain::SyncError;
  switch (e) {
    case E::SYNC_IN_PROGRESS:
      return "Another chain sync is in progress";
  }
  return "Unknown sync error";
}
