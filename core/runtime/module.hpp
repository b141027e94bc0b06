/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/blob.hpp"
#include "host_api/capability_sandbox.hpp"
#include "host_api/host_environment.hpp"
#include "host_api/host_function_spec.hpp"
#include "outcome/outcome.hpp"

namespace sealbox::host_api {
  class HostApiFactory;
}  // namespace sealbox::host_api

namespace sealbox::runtime {

  class ModuleInstance;

  struct ExportDescriptor {
    std::string name;
    host_api::ImportKind kind = host_api::ImportKind::FUNCTION;
    /// present for function exports only
    std::optional<host_api::FunctionSignature> signature;
    /// initial pages, present for memory exports only
    std::optional<uint32_t> memory_min_pages;
  };

  /**
   * Per-instance budgets enforced by the engine itself
   */
  struct InstanceConfig {
    uint32_t max_memory_pages = 0;
    uint64_t fuel_limit = 0;
  };

  /**
   * A parsed and structurally valid module, can be instantiated any number
   * of times, also concurrently
   */
  class Module {
   public:
    virtual ~Module() = default;

    virtual const common::Hash256 &digest() const = 0;

    virtual size_t codeSize() const = 0;

    virtual const std::vector<host_api::ImportDescriptor> &imports() const = 0;

    virtual const std::vector<ExportDescriptor> &exports() const = 0;

    /// Whether the binary has a start section
    virtual bool hasStartFunction() const = 0;

    /**
     * Creates a fresh instance with host functions of \param bound_imports
     * only. No guest code runs here: a module with a start function is
     * refused with ValidationError::START_FUNCTION.
     */
    virtual outcome::result<std::shared_ptr<ModuleInstance>> instantiate(
        const InstanceConfig &config,
        const host_api::HostApiFactory &host_api_factory,
        const host_api::BoundImports &bound_imports,
        const host_api::HostEnvironment &environment) const = 0;
  };

}  // namespace sealbox::runtime
