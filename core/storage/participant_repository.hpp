/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/participant.hpp"

namespace nineteen::storage {

  /**
   * Registry of participants. The chain sync agent is the only writer.
   */
  class ParticipantRepository {
   public:
    virtual ~ParticipantRepository() = default;

    /**
     * Replaces the whole participant set in one transaction. The previous
     * set is moved to history. Either everything is replaced or nothing is.
     * @param participants new set
     * @param now time of the snapshot, recorded in history
     */
    virtual outcome::result<void> replaceAll(
        const std::vector<primitives::Participant> &participants,
        primitives::Timestamp now) = 0;

    virtual outcome::result<std::vector<primitives::Participant>> getAll()
        const = 0;
  };

}  // namespace nineteen::storage
