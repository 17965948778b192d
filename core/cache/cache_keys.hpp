/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <fmt/format.h>

namespace nineteen::cache::keys {

  constexpr std::string_view kQueryQueue = "query_queue";
  constexpr std::string_view kChainSyncLock = "chain_sync:lock";

  constexpr std::string_view kTaskResultsChannel = "task_results";
  constexpr std::string_view kEligibilityChangedChannel =
      "eligibility_changed";

  inline std::string taskLease(std::string_view task_id) {
    return fmt::format("task_lease:{}", task_id);
  }

  /// Request counter of an api key within one minute
  inline std::string rateLimit(std::string_view api_key, int64_t minute) {
    return fmt::format("rate_limit:{}:{}", api_key, minute);
  }

  inline std::string syntheticRemaining(std::string_view task_type) {
    return fmt::format("task_synthetics_info:{}:requests_remaining",
                       task_type);
  }

}  // namespace nineteen::cache::keys
