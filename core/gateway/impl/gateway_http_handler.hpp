/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "http/session.hpp"

#include <memory>

#include "gateway/intake_gateway.hpp"
#include "utils/thread_pool.hpp"

namespace nineteen::gateway {

  /**
   * HTTP surface of the gateway:
   * POST /v1/tasks/<task_type> {"payload": string, "timeout_ms": int,
   * "wait": bool} and GET /health
   */
  class GatewayHttpHandler : public http::RequestHandler {
   public:
    static constexpr std::string_view kTasksPath = "/v1/tasks/";
    static constexpr std::string_view kHealthPath = "/health";
    static constexpr std::string_view kApiKeyHeader = "X-Api-Key";

    GatewayHttpHandler(std::shared_ptr<IntakeGateway> gateway,
                       size_t threads);

    void onSessionRequest(http::Session::Request request,
                          std::shared_ptr<http::Session> session) override;

    /// Produces the response to \param request, may block until the result
    http::Session::Response handle(const http::Session::Request &request);

   private:
    std::shared_ptr<IntakeGateway> gateway_;
    ThreadPool thread_pool_;
    log::Logger logger_;
  };

}  // namespace nineteen::gateway
