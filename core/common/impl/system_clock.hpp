/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/clock.hpp"

namespace sealbox::common {

  /// UTC time of the host
  class SystemClock final : public Clock {
   public:
    TimePoint now() const override;
  };

}  // namespace sealbox::common
