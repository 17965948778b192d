/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain/chain_client.hpp"

#include <atomic>
#include <chrono>
#include <memory>

#include <rapidjson/document.h>

#include "http/http_client.hpp"
#include "log/logger.hpp"

namespace nineteen::chain {

  struct ChainConfig {
    /// JSON-RPC endpoint of the chain proxy
    std::string endpoint{"http://localhost:9944"};
    uint16_t netuid{19};
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
  };

  /**
   * Talks JSON-RPC 2.0 over HTTP to a chain proxy exposing
   * `participants_get` and `weights_set`
   */
  class JrpcChainClient : public ChainClient {
   public:
    JrpcChainClient(ChainConfig config,
                    std::shared_ptr<http::HttpClient> http_client);

    outcome::result<std::vector<primitives::Participant>> fetchParticipants()
        override;

    outcome::result<std::string> submitWeights(
        primitives::Epoch epoch,
        const std::vector<primitives::WeightEntry> &weights) override;

   private:
    /**
     * Performs a call, \param params is moved into the request document
     * @return `result` member of the response
     */
    outcome::result<rapidjson::Document> call(std::string_view method,
                                              rapidjson::Document params);

    ChainConfig config_;
    std::shared_ptr<http::HttpClient> http_client_;
    std::atomic<uint64_t> next_id_{1};
    log::Logger logger_;
  };

}  // namespace nineteen::chain
