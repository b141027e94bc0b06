/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "host_api/capability.hpp"

namespace sealbox::runtime {

  /**
   * Budgets and permissions of a capsule execution
   */
  struct ResourceLimits {
    static constexpr uint32_t kDefaultMaxModuleSizeKb = 5;

    uint32_t max_module_size_kb = kDefaultMaxModuleSizeKb;
    uint32_t memory_limit_mb = 32;
    uint64_t execution_time_ms = 1000;
    uint64_t fuel_limit = 1'000'000;
    host_api::CapabilitySet capabilities{host_api::Capability::Hash,
                                         host_api::Capability::Json};

    /// 32 MB, 1000 ms, 1M fuel, {hash, json}
    static ResourceLimits defaults();

    /// Permissive: 64 MB, 5000 ms, 10M fuel, every capability
    static ResourceLimits development();

    /// Restrictive: 16 MB, 500 ms, 500k fuel, {hash}
    static ResourceLimits production();

    static std::optional<ResourceLimits> preset(std::string_view name);

    uint64_t maxModuleSizeBytes() const {
      return static_cast<uint64_t>(max_module_size_kb) * 1024;
    }

    /// Memory ceiling in 64 KiB wasm pages
    uint32_t maxMemoryPages() const;

    bool hasCapability(host_api::Capability capability) const {
      return capabilities.contains(capability);
    }

    ResourceLimits withCapability(host_api::Capability capability) const {
      auto copy = *this;
      copy.capabilities.insert(capability);
      return copy;
    }

    ResourceLimits withoutCapability(host_api::Capability capability) const {
      auto copy = *this;
      copy.capabilities.erase(capability);
      return copy;
    }

    bool operator==(const ResourceLimits &) const = default;
  };

}  // namespace sealbox::runtime
