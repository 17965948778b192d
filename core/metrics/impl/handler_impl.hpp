/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "http/session.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"

namespace nineteen::metrics {

  /**
   * Serves the text exposition of all registered metrics on GET /metrics
   */
  class HandlerImpl : public http::RequestHandler {
   public:
    HandlerImpl();
    ~HandlerImpl() override = default;

    void onSessionRequest(http::Session::Request request,
                          std::shared_ptr<http::Session> session) override;

    /// Current exposition text
    std::string collect() const;

   private:
    log::Logger logger_;
    RegistryPtr registry_;
    Counter *num_scrapes_;
    Counter *bytes_transferred_;
  };

}  // namespace nineteen::metrics
