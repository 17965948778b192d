/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispatch/impl/http_worker_client.hpp"

#include <boost/assert.hpp>
#include <fmt/format.h>

#include "dispatch/dispatch_error.hpp"

namespace nineteen::dispatch {

  HttpWorkerClient::HttpWorkerClient(
      std::shared_ptr<http::HttpClient> http_client)
      : http_client_{std::move(http_client)},
        logger_{log::createLogger("WorkerClient", "dispatch")} {
    BOOST_ASSERT(http_client_ != nullptr);
  }

  std::string HttpWorkerClient::endpointOf(
      const primitives::Participant &participant, std::string_view task_type) {
    // IPv6 literals need brackets in an authority
    if (participant.ip.find(':') != std::string::npos) {
      return fmt::format(
          "http://[{}]:{}/{}", participant.ip, participant.port, task_type);
    }
    return fmt::format(
        "http://{}:{}/{}", participant.ip, participant.port, task_type);
  }

  outcome::result<std::string> HttpWorkerClient::perform(
      const primitives::Participant &participant,
      const primitives::Task &task,
      std::chrono::milliseconds timeout) {
    http::HttpRequest request{
        .method = http::HttpMethod::Post,
        .url = endpointOf(participant, task.task_type),
        .headers = {{"X-Task-Id", task.id}},
        .body = task.payload,
    };
    auto response = http_client_->send(request, timeout);
    if (response.has_error()) {
      SL_DEBUG(logger_,
               "Task {} to {} failed: {}",
               task.id,
               participant.hotkey,
               response.error().message());
      return DispatchError::WORKER_FAILED;
    }
    if (not response.value().isSuccess()) {
      SL_DEBUG(logger_,
               "Task {} to {} answered with status {}",
               task.id,
               participant.hotkey,
               response.value().status);
      return DispatchError::WORKER_FAILED;
    }
    return std::move(response.value().body);
  }

}  // namespace nineteen::dispatch
