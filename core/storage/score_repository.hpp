/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/score.hpp"

namespace nineteen::storage {

  class ScoreRepository {
   public:
    virtual ~ScoreRepository() = default;

    virtual outcome::result<void> replaceAll(
        const std::vector<primitives::Score> &scores) = 0;

    virtual outcome::result<std::vector<primitives::Score>> getAll() const = 0;
  };

}  // namespace nineteen::storage
