/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>

#include "http/session.hpp"
#include "log/logger.hpp"

namespace nineteen::http {

  /**
   * Keep-alive connection over a strand. Reading pauses while the handler
   * works on a request, the next one is read after the response is written.
   */
  class SessionImpl final : public Session,
                            public std::enable_shared_from_this<SessionImpl> {
   public:
    using Socket = boost::asio::ip::tcp::socket;

    SessionImpl(boost::asio::io_context &io_context,
                Limits limits,
                std::shared_ptr<RequestHandler> handler,
                log::Logger logger);

    Socket &socket() {
      return stream_.socket();
    }

    void start();

    void respond(Response response) override;

   private:
    using Parser = boost::beast::http::request_parser<Request::body_type>;

    void read();
    void onRead(boost::system::error_code ec, size_t);
    void write(Response response);
    void onWrite(boost::system::error_code ec, size_t);
    void close();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    const Limits limits_;
    std::shared_ptr<RequestHandler> handler_;
    log::Logger logger_;

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<Parser> parser_;
    std::optional<Response> response_;
  };

}  // namespace nineteen::http
