/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <soralog/util.hpp>

#include "log/logger.hpp"

namespace nineteen {

  /**
   * Named threads serving one io_context until stopped. Threads are named
   * `<tag>` or `<tag>.<n>`, which is what the logs show.
   */
  class ThreadPool {
   public:
    using WorkGuard =
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    ThreadPool(std::string_view tag, size_t threads)
        : logger_{log::createLogger(fmt::format("ThreadPool:{}", tag),
                                    "threads")},
          io_context_{std::make_shared<boost::asio::io_context>()},
          work_{io_context_->get_executor()} {
      threads = std::max<size_t>(threads, 1);
      threads_.reserve(threads);
      for (size_t n = 1; n <= threads; ++n) {
        spawn(threads == 1 ? std::string{tag} : fmt::format("{}.{}", tag, n));
      }
      SL_DEBUG(logger_, "{} threads started", threads);
    }

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;
    ThreadPool(ThreadPool &&) = delete;
    ThreadPool &operator=(ThreadPool &&) = delete;

    ~ThreadPool() {
      stop();
    }

    const std::shared_ptr<boost::asio::io_context> &io_context() const {
      return io_context_;
    }

    template <typename F>
    void post(F &&f) {
      boost::asio::post(*io_context_, std::forward<F>(f));
    }

    /// Drops queued handlers and joins the threads, once
    void stop() {
      if (not work_) {
        return;
      }
      work_.reset();
      io_context_->stop();
      for (auto &thread : threads_) {
        if (thread.joinable()) {
          thread.join();
        }
      }
      SL_DEBUG(logger_, "Threads stopped");
    }

   private:
    void spawn(std::string name) {
      threads_.emplace_back(
          [logger{logger_}, io_context{io_context_}, name{std::move(name)}] {
            soralog::util::setThreadName(name);
            SL_TRACE(logger, "Thread {} runs", name);
            io_context->run();
          });
    }

    log::Logger logger_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::optional<WorkGuard> work_;
    std::vector<std::thread> threads_;
  };

}  // namespace nineteen
