/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace nineteen {

  /**
   * Shutdown flag that long-running loops sleep on, so that `stop()` wakes
   * them up immediately instead of waiting for the sleep to finish.
   */
  class StopSignal final {
   public:
    StopSignal() = default;
    StopSignal(const StopSignal &) = delete;
    StopSignal &operator=(const StopSignal &) = delete;
    StopSignal(StopSignal &&) = delete;
    StopSignal &operator=(StopSignal &&) = delete;

    void stop() {
      {
        std::lock_guard lock(mutex_);
        stopped_ = true;
      }
      cv_.notify_all();
    }

    void reset() {
      std::lock_guard lock(mutex_);
      stopped_ = false;
    }

    bool stopped() const {
      std::lock_guard lock(mutex_);
      return stopped_;
    }

    /**
     * Sleeps for \param duration
     * @return true if stop was requested before or during the sleep
     */
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) {
      std::unique_lock lock(mutex_);
      return cv_.wait_for(lock, duration, [this] { return stopped_; });
    }

   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
  };

}  // namespace nineteen
