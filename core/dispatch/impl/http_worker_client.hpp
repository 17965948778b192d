/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "dispatch/worker_client.hpp"

#include <memory>

#include "http/http_client.hpp"
#include "log/logger.hpp"

namespace nineteen::dispatch {

  /// POST http://<ip>:<port>/<task_type> with the payload as body
  class HttpWorkerClient : public WorkerClient {
   public:
    explicit HttpWorkerClient(std::shared_ptr<http::HttpClient> http_client);

    outcome::result<std::string> perform(
        const primitives::Participant &participant,
        const primitives::Task &task,
        std::chrono::milliseconds timeout) override;

    static std::string endpointOf(const primitives::Participant &participant,
                                  std::string_view task_type);

   private:
    std::shared_ptr<http::HttpClient> http_client_;
    log::Logger logger_;
  };

}  // namespace nineteen::dispatch
