/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispatch/dispatch_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nineteen::dispatch, DispatchError, e) {
  using E = nineteen::dispatch::DispatchError;
  switch (e) {
    case E::INVALID_TASK:
      return "Task has passed deadline or empty payload";
    case E::QUEUE_FULL:
      return "Task queue is full";
    case E::MALFORMED_MESSAGE:
      return "Malformed queue entry or task result";
    case E::WORKER_FAILED:
      return "Worker replied with unsuccessful status";
  }
  return "Unknown dispatch error";
}
