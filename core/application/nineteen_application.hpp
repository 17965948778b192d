/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace nineteen::application {

  /**
   * @class NineteenApplication runs the configured node role
   */
  class NineteenApplication {
   public:
    virtual ~NineteenApplication() = default;

    /// Applies pending schema migrations
    virtual int migrate() = 0;

    /// Runs the node role until shutdown
    virtual int run() = 0;
  };
}  // namespace nineteen::application
