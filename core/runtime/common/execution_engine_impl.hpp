/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "runtime/execution_engine.hpp"

#include <memory>

#include "log/logger.hpp"
#include "runtime/module.hpp"

namespace sealbox::host_api {
  class HostApiFactory;
}  // namespace sealbox::host_api

namespace sealbox::runtime {

  class ModuleFactory;
  class ModuleCache;

  class ExecutionEngineImpl final : public ExecutionEngine {
   public:
    ExecutionEngineImpl(
        std::shared_ptr<const ModuleFactory> module_factory,
        std::shared_ptr<ModuleCache> module_cache,
        std::shared_ptr<const host_api::HostApiFactory> host_api_factory,
        size_t max_io_size);

    outcome::result<Execution> execute(
        const CapsuleModule &module,
        const host_api::BoundImports &bound_imports,
        common::BufferView input,
        const ResourceLimits &limits,
        const host_api::HostEnvironment &environment,
        ExecMetrics *metrics_out,
        std::vector<host_api::AccessRecord> *access_log_out) const override;

   private:
    outcome::result<std::shared_ptr<const Module>> getModule(
        const CapsuleModule &capsule) const;

    std::shared_ptr<const ModuleFactory> module_factory_;
    std::shared_ptr<ModuleCache> module_cache_;
    std::shared_ptr<const host_api::HostApiFactory> host_api_factory_;
    size_t max_io_size_;
    log::Logger logger_;
  };

}  // namespace sealbox::runtime
