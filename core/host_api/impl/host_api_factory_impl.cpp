/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/host_api_factory_impl.hpp"

#include <boost/assert.hpp>

#include "host_api/impl/host_api_impl.hpp"

namespace sealbox::host_api {

  HostApiFactoryImpl::HostApiFactoryImpl(
      std::shared_ptr<const crypto::Hasher> hasher)
      : hasher_{std::move(hasher)} {
    BOOST_ASSERT(hasher_ != nullptr);
  }

  std::unique_ptr<HostApi> HostApiFactoryImpl::make(
      std::shared_ptr<const runtime::MemoryProvider> memory_provider,
      BoundImports bound_imports,
      const HostEnvironment &environment) const {
    return std::make_unique<HostApiImpl>(std::move(memory_provider),
                                         hasher_,
                                         std::move(bound_imports),
                                         environment);
  }

}  // namespace sealbox::host_api
