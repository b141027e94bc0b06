/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "runtime/resource_limits.hpp"

namespace sealbox::application {

  /**
   * What the runner does when an execution fails
   */
  enum class FailurePolicy : uint8_t {
    /// return the error only
    NO_RECEIPT,
    /// also sign a receipt committing to the failure marker as output
    SIGNED_FAILURE_RECEIPT,
  };

  /**
   * Engine settings, read once at startup
   */
  class EngineConfiguration {
   public:
    static constexpr size_t kDefaultModuleCacheSize = 16;

    virtual ~EngineConfiguration() = default;

    /**
     * @return limits applied to capsules that do not bring their own
     */
    virtual const runtime::ResourceLimits &limits() const = 0;

    /// Capacity of the parsed module cache
    virtual size_t moduleCacheSize() const = 0;

    /// Bound for both capsule input and output, in bytes
    virtual size_t maxIoSize() const = 0;

    virtual FailurePolicy failurePolicy() const = 0;

    /**
     * @return `level` or `group=level` entries for log::tuneLoggingSystem
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace sealbox::application
