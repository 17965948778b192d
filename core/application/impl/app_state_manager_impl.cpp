/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_state_manager_impl.hpp"

#include <csignal>

namespace nineteen::application {

  AppStateManagerImpl::AppStateManagerImpl()
      : logger_{log::createLogger("AppStateManager", "application")},
        signals_{io_context_, SIGINT, SIGTERM, SIGQUIT} {}

  AppStateManager::State AppStateManagerImpl::state() const {
    std::lock_guard lock{mutex_};
    return state_;
  }

  bool AppStateManagerImpl::failed() const {
    std::lock_guard lock{mutex_};
    return failed_;
  }

  void AppStateManagerImpl::reset() {
    std::lock_guard lock{mutex_};
    prepare_.clear();
    launch_.clear();
    shutdown_.clear();
    state_ = State::Init;
    failed_ = false;
    io_context_.restart();
  }

  void AppStateManagerImpl::atPrepare(OnPrepare &&cb) {
    std::lock_guard lock{mutex_};
    if (state_ > State::Prepare) {
      throw AppStateException("adding callback for stage 'prepare'");
    }
    prepare_.emplace_back(std::move(cb));
  }

  void AppStateManagerImpl::atLaunch(OnLaunch &&cb) {
    std::lock_guard lock{mutex_};
    if (state_ > State::Starting) {
      throw AppStateException("adding callback for stage 'launch'");
    }
    launch_.emplace_back(std::move(cb));
  }

  void AppStateManagerImpl::atShutdown(OnShutdown &&cb) {
    std::lock_guard lock{mutex_};
    if (state_ > State::ShuttingDown) {
      throw AppStateException("adding callback for stage 'shutdown'");
    }
    shutdown_.emplace_back(std::move(cb));
  }

  bool AppStateManagerImpl::enterStage(State from,
                                       State to,
                                       const char *stage) {
    std::lock_guard lock{mutex_};
    if (state_ == from) {
      state_ = to;
      return true;
    }
    if (state_ == State::ShuttingDown) {
      return false;
    }
    throw AppStateException(std::string{"running stage '"} + stage + "'");
  }

  bool AppStateManagerImpl::runStage(
      std::vector<std::function<bool()>> &callbacks,
      State expected,
      const char *stage) {
    std::vector<std::function<bool()>> pending;
    {
      std::lock_guard lock{mutex_};
      pending.swap(callbacks);
    }
    SL_TRACE(logger_, "Stage '{}' has {} callbacks", stage, pending.size());

    // Callbacks may add callbacks of later stages, so no lock is held here
    for (auto &cb : pending) {
      if (state() != expected) {
        return false;
      }
      if (not cb()) {
        SL_ERROR(logger_, "Stage '{}' is failed", stage);
        std::lock_guard lock{mutex_};
        failed_ = true;
        if (state_ == expected) {
          state_ = State::ShuttingDown;
        }
        return false;
      }
    }
    return true;
  }

  void AppStateManagerImpl::doPrepare() {
    if (enterStage(State::Init, State::Prepare, "preparing")) {
      runStage(prepare_, State::Prepare, "preparing");
    }
    std::lock_guard lock{mutex_};
    prepare_.clear();
    if (state_ == State::Prepare) {
      state_ = State::ReadyToStart;
    }
  }

  void AppStateManagerImpl::doLaunch() {
    if (enterStage(State::ReadyToStart, State::Starting, "launch")) {
      runStage(launch_, State::Starting, "launch");
    }
    std::lock_guard lock{mutex_};
    launch_.clear();
    if (state_ == State::Starting) {
      state_ = State::Works;
    }
  }

  void AppStateManagerImpl::doShutdown() {
    std::vector<OnShutdown> callbacks;
    {
      std::lock_guard lock{mutex_};
      if (state_ != State::Works and state_ != State::ShuttingDown) {
        throw AppStateException("running stage 'shutting down'");
      }
      state_ = State::ShuttingDown;
      prepare_.clear();
      launch_.clear();
      callbacks.swap(shutdown_);
    }

    // Components stop in reverse order of registration
    for (auto it = callbacks.rbegin(); it != callbacks.rend(); ++it) {
      (*it)();
    }

    std::lock_guard lock{mutex_};
    state_ = State::ReadyToStop;
  }

  void AppStateManagerImpl::run() {
    doPrepare();
    doLaunch();

    if (state() == State::Works) {
      SL_INFO(logger_, "Started, waiting for shutdown request");
      waitShutdownRequest();
    }

    SL_INFO(logger_, "Shutting down");
    doShutdown();

    if (state() != State::ReadyToStop) {
      throw std::logic_error(
          "AppStateManager is expected in stage 'ready to stop'");
    }
  }

  void AppStateManagerImpl::waitShutdownRequest() {
    signals_.async_wait(
        [this](const boost::system::error_code &ec, int signal) {
          if (ec) {
            return;
          }
          SL_INFO(logger_, "Signal {} received", signal);
          shutdown();
        });
    // Returns once shutdown() stops the context, even if it already did
    io_context_.run();

    boost::system::error_code ec;
    signals_.cancel(ec);
    if (ec) {
      SL_WARN(logger_, "Can't stop waiting for signals: {}", ec.message());
    }
  }

  void AppStateManagerImpl::shutdown() {
    {
      std::lock_guard lock{mutex_};
      if (state_ == State::ShuttingDown or state_ == State::ReadyToStop) {
        SL_TRACE(logger_, "Shutdown is already in progress");
        return;
      }
      state_ = State::ShuttingDown;
    }
    SL_DEBUG(logger_, "Shutdown requested");
    io_context_.stop();
  }
}  // namespace nineteen::application
