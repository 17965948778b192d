/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/error_class.hpp"

#include "cache/cache_error.hpp"
#include "chain/chain_error.hpp"
#include "dispatch/dispatch_error.hpp"
#include "gateway/gateway_error.hpp"
#include "http/http_error.hpp"
#include "scoring/scoring_error.hpp"
#include "storage/database_error.hpp"

namespace nineteen {

  namespace {
    template <typename E>
    bool is(const std::error_code &ec) {
      return ec.category() == make_error_code(E{}).category();
    }

    template <typename E>
    E as(const std::error_code &ec) {
      return static_cast<E>(ec.value());
    }

    ErrorClass classifyDatabase(storage::DatabaseError e) {
      using E = storage::DatabaseError;
      switch (e) {
        case E::CONNECTION_FAILED:
        case E::QUERY_FAILED:
        case E::TRANSACTION_FAILED:
          return ErrorClass::TransientIO;
        case E::DUPLICATE_KEY:
          return ErrorClass::ConsistencyViolation;
        case E::UNEXPECTED_RESULT:
        case E::SCHEMA_MISMATCH:
        case E::MIGRATION_FAILED:
          return ErrorClass::Fatal;
      }
      return ErrorClass::Fatal;
    }

    ErrorClass classifyCache(cache::CacheError e) {
      using E = cache::CacheError;
      switch (e) {
        case E::CONNECTION_FAILED:
        case E::TIMEOUT:
        case E::PROTOCOL_ERROR:
        case E::SERVER_ERROR:
          return ErrorClass::TransientIO;
        case E::LIST_FULL:
          return ErrorClass::ResourceExhausted;
        case E::UNEXPECTED_REPLY:
          return ErrorClass::Fatal;
      }
      return ErrorClass::Fatal;
    }

    ErrorClass classifyChain(chain::ChainError e) {
      using E = chain::ChainError;
      switch (e) {
        case E::BAD_RESPONSE:
        case E::RPC_ERROR:
          return ErrorClass::TransientIO;
        case E::REJECTED:
          return ErrorClass::Validation;
      }
      return ErrorClass::Fatal;
    }

    ErrorClass classifyDispatch(dispatch::DispatchError e) {
      using E = dispatch::DispatchError;
      switch (e) {
        case E::INVALID_TASK:
        case E::MALFORMED_MESSAGE:
          return ErrorClass::Validation;
        case E::QUEUE_FULL:
          return ErrorClass::ResourceExhausted;
        case E::WORKER_FAILED:
          return ErrorClass::TransientIO;
      }
      return ErrorClass::Fatal;
    }

    ErrorClass classifyScoring(scoring::ScoringError e) {
      using E = scoring::ScoringError;
      switch (e) {
        case E::NO_ELIGIBLE_PARTICIPANTS:
          return ErrorClass::Validation;
        case E::SUBMISSION_FAILED:
          return ErrorClass::TransientIO;
        case E::ALREADY_SUBMITTED:
          return ErrorClass::ConsistencyViolation;
      }
      return ErrorClass::Fatal;
    }

    ErrorClass classifyGateway(gateway::GatewayError e) {
      using E = gateway::GatewayError;
      switch (e) {
        case E::REJECTED:
        case E::UNAUTHORIZED:
          return ErrorClass::Validation;
        case E::OVERLOADED:
        case E::RATE_LIMITED:
          return ErrorClass::ResourceExhausted;
        case E::TIMEOUT:
          return ErrorClass::TransientIO;
      }
      return ErrorClass::Fatal;
    }
  }  // namespace

  ErrorClass classify(const std::error_code &ec) {
    if (is<storage::DatabaseError>(ec)) {
      return classifyDatabase(as<storage::DatabaseError>(ec));
    }
    if (is<cache::CacheError>(ec)) {
      return classifyCache(as<cache::CacheError>(ec));
    }
    if (is<http::HttpError>(ec)) {
      return as<http::HttpError>(ec) == http::HttpError::INVALID_URI
               ? ErrorClass::Validation
               : ErrorClass::TransientIO;
    }
    if (is<chain::ChainError>(ec)) {
      return classifyChain(as<chain::ChainError>(ec));
    }
    if (is<chain::SyncError>(ec)) {
      return ErrorClass::ConsistencyViolation;
    }
    if (is<dispatch::DispatchError>(ec)) {
      return classifyDispatch(as<dispatch::DispatchError>(ec));
    }
    if (is<scoring::ScoringError>(ec)) {
      return classifyScoring(as<scoring::ScoringError>(ec));
    }
    if (is<gateway::GatewayError>(ec)) {
      return classifyGateway(as<gateway::GatewayError>(ec));
    }
    if (ec.category() == std::system_category()
        or ec.category() == std::generic_category()) {
      return ErrorClass::TransientIO;
    }
    return ErrorClass::Fatal;
  }

  std::string_view toString(ErrorClass error_class) {
    switch (error_class) {
      case ErrorClass::Validation:
        return "ValidationError";
      case ErrorClass::TransientIO:
        return "TransientIOError";
      case ErrorClass::ResourceExhausted:
        return "ResourceExhausted";
      case ErrorClass::ConsistencyViolation:
        return "ConsistencyViolation";
      case ErrorClass::Fatal:
        return "Fatal";
    }
    return "Unknown";
  }

}  // namespace nineteen
