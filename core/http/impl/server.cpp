/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "http/server.hpp"

#include <fmt/format.h>
#include <soralog/util.hpp>

#include "http/impl/session_impl.hpp"

namespace nineteen::http {

  Server::Server(std::string_view name,
                 Configuration config,
                 std::shared_ptr<RequestHandler> handler)
      : logger_{log::createLogger(fmt::format("HttpServer:{}", name), "http")},
        name_{name},
        config_{std::move(config)},
        handler_{std::move(handler)} {
    BOOST_ASSERT(handler_ != nullptr);
  }

  Server::~Server() {
    stop();
  }

  bool Server::prepare() {
    boost::system::error_code ec;
    acceptor_.emplace(io_context_);
    acceptor_->open(config_.endpoint.protocol(), ec);
    if (not ec) {
      acceptor_->set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (not ec) {
      acceptor_->bind(config_.endpoint, ec);
    }
    if (not ec) {
      acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
      SL_CRITICAL(logger_,
                  "Can't listen on {}:{}: {}",
                  config_.endpoint.address().to_string(),
                  config_.endpoint.port(),
                  ec.message());
      acceptor_.reset();
      return false;
    }
    return true;
  }

  bool Server::start() {
    if (not acceptor_) {
      SL_ERROR(logger_, "Can't start before the port is bound");
      return false;
    }
    SL_INFO(logger_,
            "Listening on {}:{}",
            config_.endpoint.address().to_string(),
            port());
    accept();
    thread_ = std::thread([this] {
      soralog::util::setThreadName(fmt::format("http-{}", name_));
      io_context_.run();
    });
    return true;
  }

  void Server::stop() {
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      if (ec) {
        SL_DEBUG(logger_, "Acceptor close: {}", ec.message());
      }
    }
    io_context_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  uint16_t Server::port() const {
    if (not acceptor_) {
      return 0;
    }
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

  void Server::accept() {
    auto session = std::make_shared<SessionImpl>(
        io_context_, config_.limits, handler_, logger_);
    acceptor_->async_accept(
        session->socket(),
        [weak = weak_from_this(), session](boost::system::error_code ec) {
          auto self = weak.lock();
          if (not self or ec == boost::asio::error::operation_aborted) {
            return;
          }
          if (ec) {
            SL_DEBUG(self->logger_, "Accept failed: {}", ec.message());
          } else {
            session->start();
          }
          if (self->acceptor_ and self->acceptor_->is_open()) {
            self->accept();
          }
        });
  }

}  // namespace nineteen::http
