/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "http/impl/http_client_impl.hpp"

#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include "common/uri.hpp"
#include "http/http_error.hpp"

namespace nineteen::http {

  namespace beast = boost::beast;

  HttpClientImpl::HttpClientImpl()
      : logger_{log::createLogger("HttpClient", "http")} {}

  outcome::result<HttpResponse> HttpClientImpl::send(
      const HttpRequest &request, std::chrono::milliseconds timeout) {
    auto parsed = common::Uri::parse(request.url);
    if (parsed.has_error()) {
      SL_DEBUG(logger_,
               "URI `{}` parsing failed: {}",
               request.url,
               parsed.error().message());
      return HttpError::INVALID_URI;
    }
    auto &uri = parsed.value();
    if (uri.scheme != "http") {
      SL_DEBUG(logger_, "Unsupported URI `{}`", request.url);
      return HttpError::INVALID_URI;
    }
    auto port = std::to_string(uri.port.value_or(80));

    boost::asio::io_context io_context;
    boost::asio::ip::tcp::resolver resolver{io_context};
    beast::tcp_stream stream{io_context};
    beast::flat_buffer buffer;

    beast::http::request<beast::http::string_body> req{
        request.method == HttpMethod::Post ? beast::http::verb::post
                                           : beast::http::verb::get,
        uri.target(),
        11};
    req.set(beast::http::field::host, uri.host);
    req.set(beast::http::field::user_agent, "nineteen");
    req.set(beast::http::field::connection, "close");
    for (auto &[name, value] : request.headers) {
      req.set(name, value);
    }
    if (request.method == HttpMethod::Post) {
      req.set(beast::http::field::content_type, request.content_type);
      req.body() = request.body;
    }
    req.prepare_payload();

    beast::http::response<beast::http::string_body> res;
    std::optional<outcome::result<void>> result;

    auto fail = [&](HttpError error, const boost::system::error_code &ec) {
      SL_DEBUG(logger_, "Request to {} failed: {}", request.url, ec.message());
      result.emplace(error);
    };

    resolver.async_resolve(
        uri.host, port, [&](const auto &ec, auto endpoints) {
          if (ec) {
            return fail(HttpError::RESOLVE_FAILED, ec);
          }
          stream.async_connect(endpoints, [&](const auto &ec, const auto &) {
            if (ec) {
              return fail(HttpError::CONNECTION_FAILED, ec);
            }
            beast::http::async_write(stream, req, [&](const auto &ec, size_t) {
              if (ec) {
                return fail(HttpError::SEND_FAILED, ec);
              }
              beast::http::async_read(
                  stream, buffer, res, [&](const auto &ec, size_t) {
                    if (ec) {
                      return fail(HttpError::RECEIVE_FAILED, ec);
                    }
                    result.emplace(outcome::success());
                  });
            });
          });
        });

    io_context.run_for(timeout);
    if (not result.has_value()) {
      // Abandon the exchange, pending handlers are dropped with the context
      SL_DEBUG(logger_, "Request to {} timed out", request.url);
      boost::system::error_code ec;
      if (stream.socket().close(ec); ec) {
        SL_TRACE(logger_, "Socket close: {}", ec.message());
      }
      return HttpError::TIMEOUT;
    }
    OUTCOME_TRY(result.value());

    boost::system::error_code ec;
    if (stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both,
                                 ec);
        ec) {
      SL_TRACE(logger_, "Socket shutdown: {}", ec.message());
    }
    return HttpResponse{res.result_int(), std::move(res.body())};
  }

}  // namespace nineteen::http
