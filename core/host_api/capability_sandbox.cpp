/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/capability_sandbox.hpp"

#include <algorithm>

namespace sealbox::host_api {

  bool BoundImports::contains(HostFunctionId id) const {
    return std::ranges::any_of(
        functions, [id](const HostFunctionSpec *spec) { return spec->id == id; });
  }

  CapabilitySandbox::CapabilitySandbox(CapabilitySet granted)
      : granted_{granted},
        logger_{log::createLogger("CapabilitySandbox", "sandbox")} {}

  bool CapabilitySandbox::allowsImport(std::string_view ns,
                                       std::string_view name) const {
    if (ns != kHostNamespace) {
      return false;
    }
    auto spec = findHostFunction(name);
    return spec != nullptr and granted_.contains(spec->capability);
  }

  std::vector<std::pair<std::string_view, std::string_view>>
  CapabilitySandbox::allowList() const {
    std::vector<std::pair<std::string_view, std::string_view>> result;
    for (auto &spec : hostFunctionTable()) {
      if (granted_.contains(spec.capability)) {
        result.emplace_back(kHostNamespace, spec.name);
      }
    }
    return result;
  }

  outcome::result<BoundImports> CapabilitySandbox::bind(
      const std::vector<ImportDescriptor> &imports) const {
    BoundImports bound{.granted = granted_, .functions = {}};
    bound.functions.reserve(imports.size());
    for (auto &import : imports) {
      if (import.kind != ImportKind::FUNCTION
          or not allowsImport(import.module_name, import.name)) {
        SL_WARN(logger_,
                "Import {} denied, granted capabilities {}",
                import.qualifiedName(),
                granted_);
        return SecurityError::CAPABILITY_DENIED;
      }
      auto spec = findHostFunction(import.name);
      if (not import.signature or *import.signature != spec->signature) {
        SL_WARN(logger_,
                "Import {} denied, signature differs from the host function",
                import.qualifiedName());
        return SecurityError::CAPABILITY_DENIED;
      }
      bound.functions.push_back(spec);
    }
    SL_DEBUG(logger_,
             "Bound {} imports under capabilities {}",
             bound.functions.size(),
             granted_);
    return bound;
  }

}  // namespace sealbox::host_api
