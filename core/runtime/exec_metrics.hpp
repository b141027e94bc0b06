/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace sealbox::runtime {

  /**
   * Resource usage of one execution
   */
  struct ExecMetrics {
    uint64_t fuel_used = 0;
    /// peak linear memory in MiB
    double memory_mb = 0.0;
    uint64_t duration_ms = 0;
    uint32_t host_calls = 0;

    bool operator==(const ExecMetrics &) const = default;
  };

}  // namespace sealbox::runtime
