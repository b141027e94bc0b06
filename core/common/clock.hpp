/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace sealbox::common {

  /**
   * Source of wall-clock time for receipt timestamps, receipt age checks and
   * the time injected into capsules. Tests substitute a fixed clock.
   */
  class Clock {
   public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
  };

}  // namespace sealbox::common
