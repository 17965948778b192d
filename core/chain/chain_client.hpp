/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/participant.hpp"
#include "primitives/weight_submission.hpp"

namespace nineteen::chain {

  /**
   * External chain as seen by the validator: reading the registered
   * participants of the subnet and writing a weight vector per epoch
   */
  class ChainClient {
   public:
    virtual ~ChainClient() = default;

    /**
     * Full participant set with chain derived fields filled in. Eligibility
     * and last_updated are left for the caller.
     */
    virtual outcome::result<std::vector<primitives::Participant>>
    fetchParticipants() = 0;

    /**
     * Submits weights for \param epoch. Idempotent per epoch on the chain
     * side.
     * @return transaction reference
     */
    virtual outcome::result<std::string> submitWeights(
        primitives::Epoch epoch,
        const std::vector<primitives::WeightEntry> &weights) = 0;
  };

}  // namespace nineteen::chain
