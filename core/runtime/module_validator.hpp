/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "common/buffer_view.hpp"
#include "host_api/host_function_spec.hpp"
#include "outcome/outcome.hpp"
#include "runtime/resource_limits.hpp"
#include "runtime/validation_error.hpp"

namespace sealbox::runtime {

  /**
   * Report of an accepted module. Rejections are returned as
   * ValidationError instead.
   */
  struct ValidationResult {
    std::vector<std::string> exports;
    /// `namespace::name` of every import
    std::vector<std::string> imports;
    /// imports with their signatures, as CapabilitySandbox::bind takes them
    std::vector<host_api::ImportDescriptor> import_table;
    size_t size_bytes = 0;
    std::vector<std::string> warnings;

    double sizeKb() const {
      return static_cast<double>(size_bytes) / 1024.0;
    }
  };

  /**
   * Static admission check of capsule code. Never instantiates the module
   * or runs guest code.
   */
  class ModuleValidator {
   public:
    static constexpr std::string_view kEntryPoint = "run";
    static constexpr std::string_view kMemoryExport = "memory";
    /// share of the size limit above which a warning is reported
    static constexpr double kSizeWarningRatio = 0.8;

    virtual ~ModuleValidator() = default;

    /**
     * Checks, in order and failing on the first violation: size limit,
     * binary validity, required exports, imports allowed by the
     * capabilities of \param limits
     */
    virtual outcome::result<ValidationResult> validate(
        common::BufferView code, const ResourceLimits &limits) const = 0;
  };

}  // namespace sealbox::runtime
