/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/buffer.hpp"
#include "host_api/access_log.hpp"
#include "host_api/capability_sandbox.hpp"
#include "host_api/host_environment.hpp"
#include "outcome/outcome.hpp"
#include "runtime/capsule_module.hpp"
#include "runtime/exec_metrics.hpp"
#include "runtime/execution_error.hpp"
#include "runtime/resource_limits.hpp"

namespace sealbox::runtime {

  struct Execution {
    common::Buffer output;
    ExecMetrics metrics;
    /// host calls in the order the capsule made them
    std::vector<host_api::AccessRecord> access_log;
  };

  /**
   * Runs a validated capsule under fuel, memory and wall-clock budgets
   */
  class ExecutionEngine {
   public:
    virtual ~ExecutionEngine() = default;

    /**
     * Executes `run` of \param module once with a fresh instance.
     * @param bound_imports import table produced by CapabilitySandbox::bind
     * @param metrics_out when not null, receives the metrics of the
     * execution, also when it fails
     * @param access_log_out likewise receives the host calls made
     * @return output with metrics and host calls, or ExecutionError
     */
    virtual outcome::result<Execution> execute(
        const CapsuleModule &module,
        const host_api::BoundImports &bound_imports,
        common::BufferView input,
        const ResourceLimits &limits,
        const host_api::HostEnvironment &environment,
        ExecMetrics *metrics_out = nullptr,
        std::vector<host_api::AccessRecord> *access_log_out =
            nullptr) const = 0;
  };

}  // namespace sealbox::runtime
