/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_state_manager.hpp"

#include <mutex>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "log/logger.hpp"

namespace nineteen::application {

  /**
   * Stages run on the thread calling run(). Between launch and shutdown that
   * thread serves an io_context which waits for SIGINT, SIGTERM or SIGQUIT.
   */
  class AppStateManagerImpl : public AppStateManager {
   public:
    AppStateManagerImpl();
    AppStateManagerImpl(const AppStateManagerImpl &) = delete;
    AppStateManagerImpl(AppStateManagerImpl &&) = delete;
    AppStateManagerImpl &operator=(const AppStateManagerImpl &) = delete;
    AppStateManagerImpl &operator=(AppStateManagerImpl &&) = delete;

    ~AppStateManagerImpl() override = default;

    void atPrepare(OnPrepare &&cb) override;
    void atLaunch(OnLaunch &&cb) override;
    void atShutdown(OnShutdown &&cb) override;

    void run() override;
    void shutdown() override;

    State state() const override;
    bool failed() const override;

   protected:
    /// Forgets all callbacks and returns to Init
    void reset();

    void doPrepare() override;
    void doLaunch() override;
    void doShutdown() override;

   private:
    /**
     * Moves from \param from to \param to, unless shutdown was requested
     * meanwhile
     * @return true if the stage callbacks should run
     * @throws AppStateException in any other state
     */
    bool enterStage(State from, State to, const char *stage);

    /// Runs \param callbacks until one fails, marking the manager failed
    bool runStage(std::vector<std::function<bool()>> &callbacks,
                  State expected,
                  const char *stage);

    void waitShutdownRequest();

    log::Logger logger_;

    mutable std::recursive_mutex mutex_;
    State state_ = State::Init;
    bool failed_ = false;

    std::vector<OnPrepare> prepare_;
    std::vector<OnLaunch> launch_;
    std::vector<OnShutdown> shutdown_;

    boost::asio::io_context io_context_;
    boost::asio::signal_set signals_;
  };

}  // namespace nineteen::application
