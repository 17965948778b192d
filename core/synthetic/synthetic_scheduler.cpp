/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "synthetic/synthetic_scheduler.hpp"

#include <algorithm>
#include <charconv>

#include <boost/assert.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "cache/cache_keys.hpp"
#include "common/json.hpp"
#include "dispatch/dispatch_error.hpp"

namespace nineteen::synthetic {

  namespace {
    constexpr auto kTotalMetric = "nineteen_synthetic_total_requests";
    constexpr auto kScheduleRemainingMetric =
        "nineteen_synthetic_schedule_remaining_requests";
    constexpr auto kLatestRemainingMetric =
        "nineteen_synthetic_latest_remaining_requests";
    constexpr auto kSkippedMetric = "nineteen_synthetic_requests_to_skip";

    constexpr std::chrono::milliseconds kMaxSleep{std::chrono::seconds(2)};

    bool later(const TaskSchedule &lhs, const TaskSchedule &rhs) {
      return lhs.next_at > rhs.next_at;
    }
  }  // namespace

  int64_t plannedRequests(const primitives::TaskType &task_type,
                          size_t eligible,
                          double multiplier) {
    if (not task_type.enabled or task_type.volume_to_requests <= 0.) {
      return 0;
    }
    auto capacity = static_cast<double>(eligible)
                  * task_type.capacity_per_participant * multiplier;
    return static_cast<int64_t>(capacity / task_type.volume_to_requests);
  }

  SyntheticScheduler::SyntheticScheduler(
      application::AppStateManager &app_state_manager,
      SyntheticConfig config,
      std::vector<primitives::TaskType> task_types,
      std::shared_ptr<dispatch::TaskQueue> queue,
      std::shared_ptr<storage::ParticipantRepository> participants,
      std::shared_ptr<cache::CoordinationCache> cache,
      std::shared_ptr<clock::SystemClock> clock,
      uint64_t seed)
      : config_{config},
        task_types_{std::move(task_types)},
        queue_{std::move(queue)},
        participants_{std::move(participants)},
        cache_{std::move(cache)},
        clock_{std::move(clock)},
        random_gen_{seed},
        logger_{log::createLogger("SyntheticScheduler", "synthetic")} {
    BOOST_ASSERT(queue_ != nullptr);
    BOOST_ASSERT(participants_ != nullptr);
    BOOST_ASSERT(cache_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);

    metrics_registry_->registerGaugeFamily(
        kTotalMetric, "Synthetic requests planned for the period");
    metrics_registry_->registerGaugeFamily(
        kScheduleRemainingMetric, "Synthetic requests left in the schedule");
    metrics_registry_->registerGaugeFamily(
        kLatestRemainingMetric, "Request budget left as seen in the cache");
    metrics_registry_->registerGaugeFamily(
        kSkippedMetric, "Synthetic requests replaced by organic ones");

    app_state_manager.takeControl(*this);
  }

  SyntheticScheduler::~SyntheticScheduler() {
    stop();
  }

  bool SyntheticScheduler::start() {
    if (not config_.enabled) {
      SL_INFO(logger_, "Synthetic traffic is switched off");
      return true;
    }
    stop_signal_.reset();
    thread_pool_ = std::make_unique<ThreadPool>("synthetic", 1);
    thread_pool_->post([this] { run(); });
    return true;
  }

  void SyntheticScheduler::stop() {
    stop_signal_.stop();
    if (thread_pool_) {
      thread_pool_->stop();
      thread_pool_.reset();
    }
  }

  std::chrono::milliseconds SyntheticScheduler::periodLength() const {
    return std::chrono::milliseconds{static_cast<int64_t>(
        static_cast<double>(config_.scoring_period.count())
        * config_.scoring_period_multiplier)};
  }

  void SyntheticScheduler::run() {
    while (not stop_signal_.stopped()) {
      auto planned = beginPeriod();
      if (planned.has_error()) {
        SL_WARN(logger_,
                "Can't plan synthetic period: {}",
                planned.error().message());
        if (stop_signal_.waitFor(kMaxSleep)) {
          return;
        }
        continue;
      }
      SL_INFO(logger_,
              "Scheduling synthetics of {} task types for {} minutes",
              planned.value(),
              std::chrono::duration_cast<std::chrono::minutes>(periodLength())
                  .count());

      while (not done()) {
        if (auto res = tick(); res.has_error()) {
          SL_WARN(logger_, "Synthetic tick failed: {}", res.error().message());
        }
        auto wake_at = std::min(nextAt().value_or(period_end_), period_end_);
        auto now = clock_->now();
        auto sleep = wake_at > now
                       ? std::chrono::duration_cast<std::chrono::milliseconds>(
                             wake_at - now)
                       : std::chrono::milliseconds::zero();
        if (stop_signal_.waitFor(std::min(sleep, kMaxSleep))) {
          return;
        }
      }

      // Budgets spent early, wait for the next period
      auto now = clock_->now();
      if (period_end_ > now
          and stop_signal_.waitFor(
              std::chrono::duration_cast<std::chrono::milliseconds>(
                  period_end_ - now))) {
        return;
      }
    }
  }

  outcome::result<size_t> SyntheticScheduler::beginPeriod() {
    OUTCOME_TRY(participants, participants_->getAll());
    auto eligible = static_cast<size_t>(
        std::count_if(participants.begin(),
                      participants.end(),
                      [](const auto &p) { return p.eligible; }));

    auto now = clock_->now();
    auto period = periodLength();
    period_end_ = now + period;
    schedules_.clear();

    for (auto &type : task_types_) {
      OUTCOME_TRY(queue_->clearSynthetic(type.name));

      auto total = plannedRequests(
          type, eligible, config_.scoring_period_multiplier);
      if (total <= 0) {
        continue;
      }
      auto interval = period / (total + 1);
      auto jitter = std::uniform_int_distribution<int64_t>{
          0, std::max<int64_t>(interval.count() - 1, 0)}(random_gen_);
      TaskSchedule schedule{
          .task_type = type.name,
          .total_requests = total,
          .interval = interval,
          .next_at = now + std::chrono::milliseconds{jitter},
          .remaining = total,
      };
      OUTCOME_TRY(cache_->set(cache::keys::syntheticRemaining(type.name),
                              std::to_string(total),
                              std::nullopt));
      metrics_registry_
          ->registerGaugeMetric(kTotalMetric, {{"task", type.name}})
          ->set(static_cast<double>(total));
      SL_DEBUG(logger_,
               "{} synthetic requests of {} every {} ms",
               total,
               type.name,
               interval.count());
      schedules_.emplace_back(std::move(schedule));
      std::push_heap(schedules_.begin(), schedules_.end(), later);
    }
    return schedules_.size();
  }

  outcome::result<size_t> SyntheticScheduler::tick() {
    size_t enqueued = 0;
    while (not schedules_.empty()) {
      auto now = clock_->now();
      if (now >= period_end_ or schedules_.front().next_at > now) {
        break;
      }
      std::pop_heap(schedules_.begin(), schedules_.end(), later);
      auto schedule = std::move(schedules_.back());
      schedules_.pop_back();

      auto latest = remainingBudget(schedule.task_type);
      if (latest.has_error()) {
        // Try this slot again on the next tick
        schedules_.emplace_back(std::move(schedule));
        std::push_heap(schedules_.begin(), schedules_.end(), later);
        return latest.as_failure();
      }
      if (latest.value() <= 0) {
        SL_DEBUG(logger_,
                 "No synthetic budget left for {}",
                 schedule.task_type);
        continue;
      }

      auto to_skip = schedule.remaining - latest.value();
      metrics_registry_
          ->registerGaugeMetric(kSkippedMetric, {{"task", schedule.task_type}})
          ->set(static_cast<double>(std::max<int64_t>(to_skip, 0)));
      if (to_skip > 0) {
        SL_DEBUG(logger_,
                 "Organic traffic took {} requests of {}",
                 to_skip,
                 schedule.task_type);
        schedule.next_at += schedule.interval * to_skip;
        schedule.remaining = latest.value();
        schedules_.emplace_back(std::move(schedule));
        std::push_heap(schedules_.begin(), schedules_.end(), later);
        continue;
      }

      auto type = findType(schedule.task_type);
      BOOST_ASSERT(type != nullptr);
      OUTCOME_TRY(queued, enqueueSynthetic(*type));
      if (queued) {
        ++enqueued;
      }

      OUTCOME_TRY(left,
                  cache_->incrementBy(
                      cache::keys::syntheticRemaining(schedule.task_type),
                      -1,
                      std::nullopt));
      schedule.remaining = left;
      schedule.next_at = now + schedule.interval;
      updateGauges(schedule, latest.value());

      if (schedule.remaining > 0) {
        schedules_.emplace_back(std::move(schedule));
        std::push_heap(schedules_.begin(), schedules_.end(), later);
      } else {
        SL_DEBUG(logger_,
                 "All synthetic requests of {} scheduled",
                 schedule.task_type);
      }
    }
    return enqueued;
  }

  std::optional<primitives::Timestamp> SyntheticScheduler::nextAt() const {
    if (schedules_.empty()) {
      return std::nullopt;
    }
    return schedules_.front().next_at;
  }

  bool SyntheticScheduler::done() const {
    return schedules_.empty() or clock_->now() >= period_end_;
  }

  outcome::result<int64_t> SyntheticScheduler::remainingBudget(
      const std::string &task_type) {
    OUTCOME_TRY(value, cache_->get(cache::keys::syntheticRemaining(task_type)));
    if (not value) {
      return 0;
    }
    int64_t remaining = 0;
    auto [ptr, ec] = std::from_chars(
        value->data(), value->data() + value->size(), remaining);
    if (ec != std::errc{}) {
      return 0;
    }
    return remaining;
  }

  outcome::result<bool> SyntheticScheduler::enqueueSynthetic(
      const primitives::TaskType &type) {
    static thread_local boost::uuids::random_generator uuid_gen;
    auto now = clock_->now();

    rapidjson::Document payload(rapidjson::kObjectType);
    auto &a = payload.GetAllocator();
    payload.AddMember("task_type", common::jsonString(type.name, a), a);
    payload.AddMember("synthetic", true, a);
    payload.AddMember("seed", static_cast<uint64_t>(random_gen_()), a);

    primitives::Task task{
        .id = boost::uuids::to_string(uuid_gen()),
        .kind = primitives::TaskKind::Synthetic,
        .task_type = type.name,
        .payload = common::json2string(payload),
        .submitted_at = now,
        .deadline = now + type.timeout,
    };
    auto res = queue_->enqueue(std::move(task));
    if (res.has_error()) {
      if (res.error() == dispatch::DispatchError::QUEUE_FULL) {
        SL_DEBUG(logger_, "Queue is full, synthetic {} dropped", type.name);
        return false;
      }
      return res.as_failure();
    }
    return true;
  }

  const primitives::TaskType *SyntheticScheduler::findType(
      const std::string &name) const {
    auto it = std::find_if(task_types_.begin(),
                           task_types_.end(),
                           [&](const auto &type) { return type.name == name; });
    return it == task_types_.end() ? nullptr : &*it;
  }

  void SyntheticScheduler::updateGauges(const TaskSchedule &schedule,
                                        int64_t latest) {
    metrics_registry_
        ->registerGaugeMetric(kScheduleRemainingMetric,
                              {{"task", schedule.task_type}})
        ->set(static_cast<double>(schedule.remaining));
    metrics_registry_
        ->registerGaugeMetric(kLatestRemainingMetric,
                              {{"task", schedule.task_type}})
        ->set(static_cast<double>(latest));
  }

}  // namespace nineteen::synthetic
