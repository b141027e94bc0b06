/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "runtime/module_validator.hpp"

#include <memory>

#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "runtime/module.hpp"

namespace sealbox::runtime {

  class ModuleFactory;

  class ModuleValidatorImpl final : public ModuleValidator {
   public:
    ModuleValidatorImpl(std::shared_ptr<const ModuleFactory> module_factory,
                        std::shared_ptr<const crypto::Hasher> hasher);

    outcome::result<ValidationResult> validate(
        common::BufferView code, const ResourceLimits &limits) const override;

    /**
     * Export and import checks of an already parsed module
     */
    outcome::result<void> checkInterface(const Module &module,
                                         const ResourceLimits &limits) const;

   private:
    std::shared_ptr<const ModuleFactory> module_factory_;
    std::shared_ptr<const crypto::Hasher> hasher_;
    log::Logger logger_;
  };

}  // namespace sealbox::runtime
