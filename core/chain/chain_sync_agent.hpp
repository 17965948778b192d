/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "application/app_state_manager.hpp"
#include "cache/lease_manager.hpp"
#include "chain/chain_client.hpp"
#include "clock/clock.hpp"
#include "clock/ticker.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "storage/participant_repository.hpp"

namespace nineteen::chain {

  struct SyncConfig {
    std::chrono::milliseconds interval{std::chrono::minutes(5)};

    /// Expiry of the sync token, bounds how long a crashed agent blocks others
    std::chrono::milliseconds lock_ttl{std::chrono::minutes(2)};

    /// Participants staking more are validators, not workers
    double max_worker_stake{1000.};
  };

  /// Routable ip and port and a worker sized stake
  bool isEligible(const primitives::Participant &participant,
                  double max_worker_stake);

  /**
   * Keeps the participant table in step with the chain. The table is only
   * ever replaced as a whole; a failed pass leaves it untouched.
   */
  class ChainSyncAgent {
   public:
    ChainSyncAgent(application::AppStateManager &app_state_manager,
                   SyncConfig config,
                   std::shared_ptr<ChainClient> chain_client,
                   std::shared_ptr<storage::ParticipantRepository> participants,
                   std::shared_ptr<cache::CoordinationCache> cache,
                   std::shared_ptr<cache::LeaseManager> leases,
                   std::shared_ptr<clock::SystemClock> clock,
                   std::shared_ptr<clock::Ticker> ticker);

    bool start();
    void stop();

    /**
     * One sync pass
     * @return SyncError::SYNC_IN_PROGRESS if another agent holds the token
     */
    outcome::result<void> sync();

   private:
    outcome::result<void> syncLocked();

    SyncConfig config_;
    std::shared_ptr<ChainClient> chain_client_;
    std::shared_ptr<storage::ParticipantRepository> participants_;
    std::shared_ptr<cache::CoordinationCache> cache_;
    std::shared_ptr<cache::LeaseManager> leases_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<clock::Ticker> ticker_;
    log::Logger logger_;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();
    metrics::Counter *metric_sync_failures_;
    metrics::Gauge *metric_participants_;
    metrics::Gauge *metric_eligible_;
  };

}  // namespace nineteen::chain
