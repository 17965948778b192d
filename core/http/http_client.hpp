/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "outcome/outcome.hpp"

namespace nineteen::http {

  enum class HttpMethod : uint8_t { Get, Post };

  struct HttpRequest {
    HttpMethod method{HttpMethod::Post};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string content_type{"application/json"};
  };

  struct HttpResponse {
    unsigned status{};
    std::string body;

    bool isSuccess() const {
      return status >= 200 and status < 300;
    }
  };

  /**
   * Plain HTTP/1.1 client, one connection per request
   */
  class HttpClient {
   public:
    virtual ~HttpClient() = default;

    /**
     * Performs \param request, giving up after \param timeout in total
     * @return response of any status, HttpError on transport failure
     */
    virtual outcome::result<HttpResponse> send(
        const HttpRequest &request, std::chrono::milliseconds timeout) = 0;
  };

}  // namespace nineteen::http
