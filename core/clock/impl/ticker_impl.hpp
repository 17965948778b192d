/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/ticker.hpp"

#include <atomic>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace nineteen::clock {

  /// Ticker over a steady_timer of a shared io_context
  class TickerImpl final : public Ticker,
                           public std::enable_shared_from_this<TickerImpl> {
   public:
    TickerImpl(std::shared_ptr<boost::asio::io_context> io_context,
               SteadyClock::Duration interval);

    void onTick(Callback cb) override;
    void start(SteadyClock::Duration delay) override;
    void stop() override;
    bool running() const override;

   private:
    void arm(SteadyClock::Duration delay);
    void fire(const boost::system::error_code &ec);

    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::steady_timer timer_;
    const SteadyClock::Duration interval_;
    Callback callback_;
    std::atomic_bool running_{false};
  };

}  // namespace nineteen::clock
