/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <stdexcept>

#include "log/logger.hpp"

namespace nineteen::application {

  // A component takes part in a stage by having the method of that stage.
  // Return types are not checked, a wrong one fails in takeControl.
  template <typename T>
  concept AppStatePreparable = requires(T &t) { t.prepare(); };
  template <typename T>
  concept AppStateStartable = requires(T &t) { t.start(); };
  template <typename T>
  concept AppStateStoppable = requires(T &t) { t.stop(); };

  template <typename T>
  concept AppStateControllable =
      AppStatePreparable<T> || AppStateStoppable<T> || AppStateStartable<T>;

  /**
   * Drives the components of a node through prepare, launch and shutdown.
   * A failed prepare or launch callback skips the rest of the startup, runs
   * the shutdown callbacks and leaves the manager failed, so the process can
   * exit with an error.
   */
  class AppStateManager : public std::enable_shared_from_this<AppStateManager> {
   public:
    using OnPrepare = std::function<bool()>;
    using OnLaunch = std::function<bool()>;
    using OnShutdown = std::function<void()>;

    enum class State {
      Init,
      Prepare,
      ReadyToStart,
      Starting,
      Works,
      ShuttingDown,
      ReadyToStop,
    };

    virtual ~AppStateManager() = default;

    /// Adds \param cb to the prepare stage, e.g. schema check or subscribe
    virtual void atPrepare(OnPrepare &&cb) = 0;

    /// Adds \param cb to the launch stage, where loops and listeners start
    virtual void atLaunch(OnLaunch &&cb) = 0;

    /// Adds \param cb to the shutdown stage, run in reverse order
    virtual void atShutdown(OnShutdown &&cb) = 0;

    /// Registers prepare(), start() and stop() of \param entity, if it has
    /// them
    template <AppStateControllable Controlled>
    void takeControl(Controlled &entity) {
      if constexpr (AppStatePreparable<Controlled>) {
        atPrepare([&entity]() -> bool { return entity.prepare(); });
      }
      if constexpr (AppStateStartable<Controlled>) {
        atLaunch([&entity]() -> bool { return entity.start(); });
      }
      if constexpr (AppStateStoppable<Controlled>) {
        atShutdown([&entity]() -> void { return entity.stop(); });
      }
    }

    /// Runs all stages, blocking until shutdown is requested
    virtual void run() = 0;

    /// Requests shutdown, callable from any thread at any time
    virtual void shutdown() = 0;

    virtual State state() const = 0;

    /// True if some prepare or launch callback failed
    virtual bool failed() const = 0;

   protected:
    virtual void doPrepare() = 0;
    virtual void doLaunch() = 0;
    virtual void doShutdown() = 0;
  };

  struct AppStateException : public std::runtime_error {
    explicit AppStateException(std::string message)
        : std::runtime_error("Wrong workflow at " + std::move(message)) {}
  };
}  // namespace nineteen::application
