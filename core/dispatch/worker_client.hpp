/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "outcome/outcome.hpp"
#include "primitives/task.hpp"

namespace nineteen::dispatch {

  /**
   * Sends tasks to worker nodes
   */
  class WorkerClient {
   public:
    virtual ~WorkerClient() = default;

    /**
     * Performs \param task on \param participant
     * @return response body, DispatchError::WORKER_FAILED on a non 2xx
     * status or a transport error of the underlying client
     */
    virtual outcome::result<std::string> perform(
        const primitives::Participant &participant,
        const primitives::Task &task,
        std::chrono::milliseconds timeout) = 0;
  };

}  // namespace nineteen::dispatch
