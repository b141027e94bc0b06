/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include "host_api/capability.hpp"
#include "host_api/host_function_spec.hpp"
#include "host_api/security_error.hpp"
#include "log/logger.hpp"

namespace sealbox::host_api {

  /**
   * Import table resolved against the granted capabilities.
   * Entries follow the import order of the module.
   */
  struct BoundImports {
    CapabilitySet granted;
    std::vector<const HostFunctionSpec *> functions;

    bool contains(HostFunctionId id) const;
  };

  /**
   * Authorization boundary between a capsule and the host.
   * The allow-list is a pure function of the granted capability set.
   */
  class CapabilitySandbox {
   public:
    explicit CapabilitySandbox(CapabilitySet granted);

    const CapabilitySet &granted() const {
      return granted_;
    }

    bool hasCapability(Capability capability) const {
      return granted_.contains(capability);
    }

    /**
     * @return true if the host function \param name is bound under
     * \param ns by one of the granted capabilities
     */
    bool allowsImport(std::string_view ns, std::string_view name) const;

    /**
     * Allowed `(namespace, name)` entries, in host function table order
     */
    std::vector<std::pair<std::string_view, std::string_view>> allowList()
        const;

    /**
     * Resolves every import of a module to a host function.
     * Fails with SecurityError::CAPABILITY_DENIED on the first import that
     * is not allowed or whose signature differs from the host function.
     */
    outcome::result<BoundImports> bind(
        const std::vector<ImportDescriptor> &imports) const;

   private:
    CapabilitySet granted_;
    log::Logger logger_;
  };

}  // namespace sealbox::host_api
