/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace nineteen::http {

  /// Accepted connection, answering its requests one by one
  class Session {
   public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response =
        boost::beast::http::response<boost::beast::http::string_body>;

    struct Limits {
      size_t max_request_size = 1 << 20;
      std::chrono::seconds io_timeout{30};
    };

    virtual ~Session() = default;

    /// Answers the request being handled, callable from any thread
    virtual void respond(Response response) = 0;
  };

  class RequestHandler {
   public:
    virtual ~RequestHandler() = default;

    /// Must call session->respond() exactly once, now or later
    virtual void onSessionRequest(Session::Request request,
                                  std::shared_ptr<Session> session) = 0;
  };

  /// Response to \param request carrying \param body of \param content_type
  Session::Response makeResponse(const Session::Request &request,
                                 boost::beast::http::status status,
                                 std::string body,
                                 std::string_view content_type);

}  // namespace nineteen::http
