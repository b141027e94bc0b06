/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>

namespace sealbox::host_api {

  /**
   * Inputs that make host functions deterministic: the value returned by
   * `time_now_ms` and the seed of the `random_bytes` stream
   */
  struct HostEnvironment {
    using Seed = std::array<uint8_t, 32>;

    uint64_t time_ms = 0;
    Seed random_seed{};

    bool operator==(const HostEnvironment &) const = default;
  };

}  // namespace sealbox::host_api
