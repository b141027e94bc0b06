/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "host_api/capability_sandbox.hpp"
#include "host_api/host_api.hpp"
#include "host_api/host_environment.hpp"

namespace sealbox::runtime {
  class MemoryProvider;
}  // namespace sealbox::runtime

namespace sealbox::host_api {

  class HostApiFactory {
   public:
    virtual ~HostApiFactory() = default;

    /**
     * Creates host functions state for a single execution
     */
    virtual std::unique_ptr<HostApi> make(
        std::shared_ptr<const runtime::MemoryProvider> memory_provider,
        BoundImports bound_imports,
        const HostEnvironment &environment) const = 0;
  };

}  // namespace sealbox::host_api
