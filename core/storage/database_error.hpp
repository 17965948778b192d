/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nineteen::storage {

  /**
   * Errors of the relational state store
   */
  enum class DatabaseError {
    CONNECTION_FAILED = 1,
    QUERY_FAILED,
    TRANSACTION_FAILED,
    UNEXPECTED_RESULT,
    DUPLICATE_KEY,
    SCHEMA_MISMATCH,
    MIGRATION_FAILED,
  };

}  // namespace nineteen::storage

OUTCOME_HPP_DECLARE_ERROR(nineteen::storage, DatabaseError);
