/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/database_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nineteen::storage, DatabaseError, e) {
  using E = nineteen::storage::DatabaseError;
  switch (e) {
    case E::CONNECTION_FAILED:
      return "Connection to the database failed";
    case E::QUERY_FAILED:
      return "Database query failed";
    case E::TRANSACTION_FAILED:
      return "Database transaction failed";
    case E::UNEXPECTED_RESULT:
      return "Database returned unexpected result";
    case E::DUPLICATE_KEY:
      return "Row with the same key already exists";
    case E::SCHEMA_MISMATCH:
      return "Database schema version does not match the required one";
    case E::MIGRATION_FAILED:
      return "Database migration failed";
  }
  return "Unknown database error";
}
