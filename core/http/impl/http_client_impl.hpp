/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "http/http_client.hpp"

#include "log/logger.hpp"

namespace nineteen::http {

  /**
   * Runs each request on an io_context of its own, so concurrent callers
   * never share state
   */
  class HttpClientImpl : public HttpClient {
   public:
    HttpClientImpl();

    outcome::result<HttpResponse> send(
        const HttpRequest &request, std::chrono::milliseconds timeout) override;

   private:
    log::Logger logger_;
  };

}  // namespace nineteen::http
