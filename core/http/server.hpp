/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "http/session.hpp"
#include "log/logger.hpp"

namespace nineteen::http {

  /**
   * HTTP/1.1 listener of the gateway or the metrics endpoint, serving every
   * session on one thread of its own
   */
  class Server : public std::enable_shared_from_this<Server> {
   public:
    using Endpoint = boost::asio::ip::tcp::endpoint;

    struct Configuration {
      Endpoint endpoint{boost::asio::ip::address_v4::any(), 0};
      Session::Limits limits{};
    };

    Server(std::string_view name,
           Configuration config,
           std::shared_ptr<RequestHandler> handler);

    ~Server();

    /// Binds the port, port 0 picks a free one
    bool prepare();

    bool start();

    void stop();

    /// Bound port, 0 before prepare()
    uint16_t port() const;

   private:
    void accept();

    log::Logger logger_;
    const std::string name_;
    const Configuration config_;
    std::shared_ptr<RequestHandler> handler_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::ip::tcp::acceptor> acceptor_;
    std::thread thread_;
  };

}  // namespace nineteen::http
