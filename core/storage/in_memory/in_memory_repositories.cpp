/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_repositories.hpp"

#include <algorithm>

#include "storage/database_error.hpp"

namespace nineteen::storage {

  outcome::result<void> InMemoryParticipantRepository::replaceAll(
      const std::vector<primitives::Participant> &participants,
      primitives::Timestamp now) {
    state_.exclusiveAccess([&](State &state) {
      for (auto &participant : state.current) {
        state.history.push_back({participant, now});
      }
      state.current = participants;
      std::sort(state.current.begin(),
                state.current.end(),
                [](auto &lhs, auto &rhs) { return lhs.node_id < rhs.node_id; });
    });
    return outcome::success();
  }

  outcome::result<std::vector<primitives::Participant>>
  InMemoryParticipantRepository::getAll() const {
    return state_.sharedAccess([](const State &state) { return state.current; });
  }

  std::vector<InMemoryParticipantRepository::HistoryEntry>
  InMemoryParticipantRepository::history() const {
    return state_.sharedAccess([](const State &state) { return state.history; });
  }

  outcome::result<void> InMemoryTaskRepository::insert(
      const primitives::Task &task) {
    auto inserted = tasks_.exclusiveAccess(
        [&](auto &tasks) { return tasks.emplace(task.id, task).second; });
    if (not inserted) {
      return DatabaseError::DUPLICATE_KEY;
    }
    return outcome::success();
  }

  outcome::result<std::optional<primitives::Task>> InMemoryTaskRepository::get(
      const primitives::TaskId &id) const {
    return tasks_.sharedAccess(
        [&](auto &tasks) -> std::optional<primitives::Task> {
          auto it = tasks.find(id);
          if (it == tasks.end()) {
            return std::nullopt;
          }
          return it->second;
        });
  }

  outcome::result<bool> InMemoryTaskRepository::update(
      const primitives::Task &task, primitives::TaskStatus expected) {
    return tasks_.exclusiveAccess([&](auto &tasks) {
      auto it = tasks.find(task.id);
      if (it == tasks.end() or it->second.status != expected
          or primitives::isTerminal(it->second.status)) {
        return false;
      }
      it->second.status = task.status;
      it->second.assigned_participant = task.assigned_participant;
      it->second.attempts = task.attempts;
      return true;
    });
  }

  outcome::result<void> InMemoryTaskRepository::remove(
      const primitives::TaskId &id) {
    tasks_.exclusiveAccess([&](auto &tasks) {
      auto it = tasks.find(id);
      if (it != tasks.end()
          and it->second.status == primitives::TaskStatus::Pending) {
        tasks.erase(it);
      }
    });
    return outcome::success();
  }

  outcome::result<std::vector<primitives::Task>>
  InMemoryTaskRepository::getNonTerminal() const {
    auto result = tasks_.sharedAccess([](auto &tasks) {
      std::vector<primitives::Task> result;
      for (auto &[_, task] : tasks) {
        if (not primitives::isTerminal(task.status)) {
          result.push_back(task);
        }
      }
      return result;
    });
    std::stable_sort(result.begin(), result.end(), [](auto &lhs, auto &rhs) {
      return lhs.submitted_at < rhs.submitted_at;
    });
    return result;
  }

  outcome::result<bool> InMemoryOutcomeRepository::insert(
      const primitives::TaskOutcome &outcome) {
    return outcomes_.exclusiveAccess([&](auto &outcomes) {
      return outcomes.emplace(Key{outcome.task_id, outcome.hotkey}, outcome)
          .second;
    });
  }

  outcome::result<std::vector<primitives::TaskOutcome>>
  InMemoryOutcomeRepository::getSince(primitives::Timestamp since) const {
    return outcomes_.sharedAccess([&](auto &outcomes) {
      std::vector<primitives::TaskOutcome> result;
      for (auto &[_, outcome] : outcomes) {
        if (outcome.timestamp >= since) {
          result.push_back(outcome);
        }
      }
      return result;
    });
  }

  outcome::result<std::vector<primitives::TaskOutcome>>
  InMemoryOutcomeRepository::getForTask(
      const primitives::TaskId &task_id) const {
    return outcomes_.sharedAccess([&](auto &outcomes) {
      std::vector<primitives::TaskOutcome> result;
      for (auto it = outcomes.lower_bound(Key{task_id, {}});
           it != outcomes.end() and it->first.first == task_id;
           ++it) {
        result.push_back(it->second);
      }
      return result;
    });
  }

  outcome::result<void> InMemoryScoreRepository::replaceAll(
      const std::vector<primitives::Score> &scores) {
    scores_.exclusiveAccess([&](auto &stored) {
      stored = scores;
      std::sort(stored.begin(), stored.end(), [](auto &lhs, auto &rhs) {
        return lhs.hotkey < rhs.hotkey;
      });
    });
    return outcome::success();
  }

  outcome::result<std::vector<primitives::Score>>
  InMemoryScoreRepository::getAll() const {
    return scores_.sharedAccess([](auto &scores) { return scores; });
  }

  outcome::result<std::optional<primitives::WeightSubmission>>
  InMemoryWeightSubmissionRepository::get(primitives::Epoch epoch) const {
    return submissions_.sharedAccess(
        [&](auto &submissions) -> std::optional<primitives::WeightSubmission> {
          auto it = submissions.find(epoch);
          if (it == submissions.end()) {
            return std::nullopt;
          }
          return it->second;
        });
  }

  outcome::result<bool> InMemoryWeightSubmissionRepository::store(
      const primitives::WeightSubmission &submission) {
    return submissions_.exclusiveAccess([&](auto &submissions) {
      auto [it, inserted] = submissions.emplace(submission.epoch, submission);
      if (inserted) {
        return true;
      }
      if (it->second.status == primitives::SubmissionStatus::Submitted) {
        return false;
      }
      it->second = submission;
      return true;
    });
  }

  size_t InMemoryWeightSubmissionRepository::size() const {
    return submissions_.sharedAccess(
        [](auto &submissions) { return submissions.size(); });
  }

}  // namespace nineteen::storage
