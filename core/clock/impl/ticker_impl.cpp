/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/ticker_impl.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace nineteen::clock {

  TickerImpl::TickerImpl(std::shared_ptr<boost::asio::io_context> io_context,
                         SteadyClock::Duration interval)
      : io_context_{std::move(io_context)},
        timer_{*io_context_},
        interval_{interval} {}

  void TickerImpl::onTick(Callback cb) {
    if (not running_) {
      callback_ = std::move(cb);
    }
  }

  void TickerImpl::start(SteadyClock::Duration delay) {
    if (not callback_ or running_.exchange(true)) {
      return;
    }
    arm(delay);
  }

  void TickerImpl::stop() {
    if (not running_.exchange(false)) {
      return;
    }
    // the timer belongs to the io_context thread
    boost::asio::post(*io_context_, [weak = weak_from_this()] {
      if (auto self = weak.lock()) {
        self->timer_.cancel();
      }
    });
  }

  bool TickerImpl::running() const {
    return running_;
  }

  void TickerImpl::arm(SteadyClock::Duration delay) {
    timer_.expires_after(delay);
    timer_.async_wait(
        [weak = weak_from_this()](const boost::system::error_code &ec) {
          if (auto self = weak.lock()) {
            self->fire(ec);
          }
        });
  }

  void TickerImpl::fire(const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted or not running_) {
      return;
    }
    callback_(ec ? std::make_error_code(std::errc::io_error)
                 : std::error_code{});
    if (running_) {
      arm(interval_);
    }
  }

}  // namespace nineteen::clock
