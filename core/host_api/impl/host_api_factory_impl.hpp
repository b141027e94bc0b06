/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "host_api/host_api_factory.hpp"

#include "crypto/hasher.hpp"

namespace sealbox::host_api {

  class HostApiFactoryImpl final : public HostApiFactory {
   public:
    explicit HostApiFactoryImpl(std::shared_ptr<const crypto::Hasher> hasher);

    ~HostApiFactoryImpl() override = default;

    std::unique_ptr<HostApi> make(
        std::shared_ptr<const runtime::MemoryProvider> memory_provider,
        BoundImports bound_imports,
        const HostEnvironment &environment) const override;

   private:
    std::shared_ptr<const crypto::Hasher> hasher_;
  };

}  // namespace sealbox::host_api
