/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/chain_sync_agent.hpp"

#include <algorithm>
#include <set>

#include "cache/cache_keys.hpp"
#include "chain/chain_error.hpp"

namespace nineteen::chain {

  namespace {
    constexpr auto kSyncFailuresMetric = "nineteen_chain_sync_failures_total";
    constexpr auto kParticipantsMetric = "nineteen_chain_participants";
    constexpr auto kEligibleMetric = "nineteen_chain_eligible_participants";

    std::set<primitives::Hotkey> eligibleSet(
        const std::vector<primitives::Participant> &participants) {
      std::set<primitives::Hotkey> result;
      for (auto &participant : participants) {
        if (participant.eligible) {
          result.insert(participant.hotkey);
        }
      }
      return result;
    }
  }  // namespace

  bool isEligible(const primitives::Participant &participant,
                  double max_worker_stake) {
    return not participant.ip.empty() and participant.ip != "0.0.0.0"
       and participant.port != 0 and participant.stake <= max_worker_stake;
  }

  ChainSyncAgent::ChainSyncAgent(
      application::AppStateManager &app_state_manager,
      SyncConfig config,
      std::shared_ptr<ChainClient> chain_client,
      std::shared_ptr<storage::ParticipantRepository> participants,
      std::shared_ptr<cache::CoordinationCache> cache,
      std::shared_ptr<cache::LeaseManager> leases,
      std::shared_ptr<clock::SystemClock> clock,
      std::shared_ptr<clock::Ticker> ticker)
      : config_{config},
        chain_client_{std::move(chain_client)},
        participants_{std::move(participants)},
        cache_{std::move(cache)},
        leases_{std::move(leases)},
        clock_{std::move(clock)},
        ticker_{std::move(ticker)},
        logger_{log::createLogger("ChainSyncAgent", "chain")} {
    BOOST_ASSERT(chain_client_ != nullptr);
    BOOST_ASSERT(participants_ != nullptr);
    BOOST_ASSERT(cache_ != nullptr);
    BOOST_ASSERT(leases_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
    BOOST_ASSERT(ticker_ != nullptr);

    metrics_registry_->registerCounterFamily(kSyncFailuresMetric,
                                             "Failed chain sync passes");
    metric_sync_failures_ =
        metrics_registry_->registerCounterMetric(kSyncFailuresMetric);
    metrics_registry_->registerGaugeFamily(kParticipantsMetric,
                                           "Participants registered on chain");
    metric_participants_ =
        metrics_registry_->registerGaugeMetric(kParticipantsMetric);
    metrics_registry_->registerGaugeFamily(
        kEligibleMetric, "Participants eligible for dispatch");
    metric_eligible_ = metrics_registry_->registerGaugeMetric(kEligibleMetric);

    app_state_manager.takeControl(*this);
  }

  bool ChainSyncAgent::start() {
    ticker_->onTick([this](const std::error_code &ec) {
      if (ec) {
        SL_ERROR(logger_, "Sync timer failed: {}", ec.message());
        return;
      }
      if (auto res = sync(); res.has_error()) {
        if (res.error() == SyncError::SYNC_IN_PROGRESS) {
          SL_DEBUG(logger_, "Another agent is syncing, skipped");
          return;
        }
        metric_sync_failures_->inc();
        SL_WARN(logger_,
                "Sync failed, retrying on next tick: {}",
                res.error().message());
      }
    });
    // First pass right away
    ticker_->start(std::chrono::milliseconds::zero());
    SL_INFO(logger_,
            "Chain sync started with interval {} s",
            std::chrono::duration_cast<std::chrono::seconds>(config_.interval)
                .count());
    return true;
  }

  void ChainSyncAgent::stop() {
    ticker_->stop();
  }

  outcome::result<void> ChainSyncAgent::sync() {
    auto lock_key = cache::keys::kChainSyncLock;
    OUTCOME_TRY(acquired, leases_->acquire(lock_key, config_.lock_ttl));
    if (not acquired) {
      return SyncError::SYNC_IN_PROGRESS;
    }
    auto result = syncLocked();
    if (auto released = leases_->release(lock_key); released.has_error()) {
      SL_WARN(logger_,
              "Can't release sync token, it lapses by itself: {}",
              released.error().message());
    }
    return result;
  }

  outcome::result<void> ChainSyncAgent::syncLocked() {
    // Everything is read before anything is written
    OUTCOME_TRY(fetched, chain_client_->fetchParticipants());
    OUTCOME_TRY(previous, participants_->getAll());

    auto now = clock_->now();
    for (auto &participant : fetched) {
      participant.eligible = isEligible(participant, config_.max_worker_stake);
      participant.last_updated = now;
    }

    OUTCOME_TRY(participants_->replaceAll(fetched, now));

    auto eligible = eligibleSet(fetched);
    metric_participants_->set(static_cast<double>(fetched.size()));
    metric_eligible_->set(static_cast<double>(eligible.size()));
    SL_INFO(logger_,
            "Synced {} participants, {} eligible",
            fetched.size(),
            eligible.size());

    if (eligible != eligibleSet(previous)) {
      auto message = std::to_string(clock::toMillis(now));
      if (auto res = cache_->publish(
              cache::keys::kEligibilityChangedChannel, message);
          res.has_error()) {
        // Subscribers also refresh on their own schedule
        SL_WARN(logger_,
                "Can't announce eligibility change: {}",
                res.error().message());
      }
    }
    return outcome::success();
  }

}  // namespace nineteen::chain
