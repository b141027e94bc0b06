/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/resource_limits.hpp"

#include <algorithm>

#include "runtime/types.hpp"

namespace sealbox::runtime {

  ResourceLimits ResourceLimits::defaults() {
    return ResourceLimits{};
  }

  ResourceLimits ResourceLimits::development() {
    ResourceLimits limits;
    limits.memory_limit_mb = 64;
    limits.execution_time_ms = 5000;
    limits.fuel_limit = 10'000'000;
    limits.capabilities = host_api::CapabilitySet::all();
    return limits;
  }

  ResourceLimits ResourceLimits::production() {
    ResourceLimits limits;
    limits.memory_limit_mb = 16;
    limits.execution_time_ms = 500;
    limits.fuel_limit = 500'000;
    limits.capabilities = host_api::CapabilitySet{host_api::Capability::Hash};
    return limits;
  }

  std::optional<ResourceLimits> ResourceLimits::preset(std::string_view name) {
    if (name == "default") {
      return defaults();
    }
    if (name == "development") {
      return development();
    }
    if (name == "production") {
      return production();
    }
    return std::nullopt;
  }

  uint32_t ResourceLimits::maxMemoryPages() const {
    // 4 GiB address space holds 65536 pages
    constexpr uint64_t kMaxPages = 65536;
    return static_cast<uint32_t>(std::min<uint64_t>(
        static_cast<uint64_t>(memory_limit_mb) * kPagesPerMb, kMaxPages));
  }

}  // namespace sealbox::runtime
