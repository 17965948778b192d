/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "http/impl/session_impl.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

namespace nineteen::http {

  namespace beast = boost::beast;

  Session::Response makeResponse(const Session::Request &request,
                                 beast::http::status status,
                                 std::string body,
                                 std::string_view content_type) {
    Session::Response response{status, request.version()};
    response.set(beast::http::field::server, "nineteen");
    response.set(beast::http::field::content_type,
                 beast::string_view{content_type.data(), content_type.size()});
    response.keep_alive(request.keep_alive());
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
  }

  SessionImpl::SessionImpl(boost::asio::io_context &io_context,
                           Limits limits,
                           std::shared_ptr<RequestHandler> handler,
                           log::Logger logger)
      : strand_{boost::asio::make_strand(io_context)},
        limits_{limits},
        handler_{std::move(handler)},
        logger_{std::move(logger)},
        stream_{Socket{strand_}} {}

  void SessionImpl::start() {
    boost::asio::post(strand_, [self = shared_from_this()] { self->read(); });
  }

  void SessionImpl::respond(Response response) {
    boost::asio::post(
        strand_,
        [self = shared_from_this(), response = std::move(response)]() mutable {
          self->write(std::move(response));
        });
  }

  void SessionImpl::read() {
    parser_.emplace();
    parser_->body_limit(limits_.max_request_size);
    stream_.expires_after(limits_.io_timeout);
    beast::http::async_read(
        stream_,
        buffer_,
        *parser_,
        beast::bind_front_handler(&SessionImpl::onRead, shared_from_this()));
  }

  void SessionImpl::onRead(boost::system::error_code ec, size_t) {
    if (ec == beast::http::error::end_of_stream or ec == beast::error::timeout) {
      return close();
    }
    if (ec) {
      SL_DEBUG(logger_, "Can't read request: {}", ec.message());
      return close();
    }
    // the handler may take longer than the io timeout
    stream_.expires_never();
    handler_->onSessionRequest(parser_->release(), shared_from_this());
  }

  void SessionImpl::write(Response response) {
    response_.emplace(std::move(response));
    stream_.expires_after(limits_.io_timeout);
    beast::http::async_write(
        stream_,
        *response_,
        beast::bind_front_handler(&SessionImpl::onWrite, shared_from_this()));
  }

  void SessionImpl::onWrite(boost::system::error_code ec, size_t) {
    if (ec) {
      SL_DEBUG(logger_, "Can't write response: {}", ec.message());
      return close();
    }
    auto keep_alive = response_->keep_alive();
    response_.reset();
    if (not keep_alive) {
      return close();
    }
    read();
  }

  void SessionImpl::close() {
    boost::system::error_code ec;
    stream_.socket().shutdown(Socket::shutdown_both, ec);
    if (ec and ec != boost::asio::error::not_connected) {
      SL_TRACE(logger_, "Socket shutdown: {}", ec.message());
    }
  }

}  // namespace nineteen::http
