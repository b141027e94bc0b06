/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/impl/system_clock.hpp"

namespace sealbox::common {

  SystemClock::TimePoint SystemClock::now() const {
    return std::chrono::system_clock::now();
  }

}  // namespace sealbox::common
