/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <unordered_map>

#include "storage/outcome_repository.hpp"
#include "storage/participant_repository.hpp"
#include "storage/score_repository.hpp"
#include "storage/task_repository.hpp"
#include "storage/weight_submission_repository.hpp"
#include "utils/safe_object.hpp"

/**
 * Repositories kept in process memory. They follow the same contracts as the
 * Postgres ones and are used by tests and single-process setups.
 */
namespace nineteen::storage {

  class InMemoryParticipantRepository : public ParticipantRepository {
   public:
    struct HistoryEntry {
      primitives::Participant participant;
      primitives::Timestamp recorded_at;
    };

    outcome::result<void> replaceAll(
        const std::vector<primitives::Participant> &participants,
        primitives::Timestamp now) override;

    outcome::result<std::vector<primitives::Participant>> getAll()
        const override;

    std::vector<HistoryEntry> history() const;

   private:
    struct State {
      std::vector<primitives::Participant> current;
      std::vector<HistoryEntry> history;
    };
    SafeObject<State> state_;
  };

  class InMemoryTaskRepository : public TaskRepository {
   public:
    outcome::result<void> insert(const primitives::Task &task) override;

    outcome::result<std::optional<primitives::Task>> get(
        const primitives::TaskId &id) const override;

    outcome::result<bool> update(const primitives::Task &task,
                                 primitives::TaskStatus expected) override;

    outcome::result<void> remove(const primitives::TaskId &id) override;

    outcome::result<std::vector<primitives::Task>> getNonTerminal()
        const override;

   private:
    SafeObject<std::map<primitives::TaskId, primitives::Task>> tasks_;
  };

  class InMemoryOutcomeRepository : public OutcomeRepository {
   public:
    outcome::result<bool> insert(
        const primitives::TaskOutcome &outcome) override;

    outcome::result<std::vector<primitives::TaskOutcome>> getSince(
        primitives::Timestamp since) const override;

    outcome::result<std::vector<primitives::TaskOutcome>> getForTask(
        const primitives::TaskId &task_id) const override;

   private:
    using Key = std::pair<primitives::TaskId, primitives::Hotkey>;
    SafeObject<std::map<Key, primitives::TaskOutcome>> outcomes_;
  };

  class InMemoryScoreRepository : public ScoreRepository {
   public:
    outcome::result<void> replaceAll(
        const std::vector<primitives::Score> &scores) override;

    outcome::result<std::vector<primitives::Score>> getAll() const override;

   private:
    SafeObject<std::vector<primitives::Score>> scores_;
  };

  class InMemoryWeightSubmissionRepository
      : public WeightSubmissionRepository {
   public:
    outcome::result<std::optional<primitives::WeightSubmission>> get(
        primitives::Epoch epoch) const override;

    outcome::result<bool> store(
        const primitives::WeightSubmission &submission) override;

    size_t size() const;

   private:
    SafeObject<std::map<primitives::Epoch, primitives::WeightSubmission>>
        submissions_;
  };

}  // namespace nineteen::storage
