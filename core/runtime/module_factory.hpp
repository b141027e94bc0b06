/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/blob.hpp"
#include "common/buffer_view.hpp"
#include "outcome/outcome.hpp"
#include "runtime/module.hpp"

namespace sealbox::runtime {

  /**
   * Parses and structurally validates WebAssembly binaries.
   * Nothing is instantiated and no guest code runs.
   */
  class ModuleFactory {
   public:
    virtual ~ModuleFactory() = default;

    /**
     * @return parsed module or ValidationError::MALFORMED
     */
    virtual outcome::result<std::shared_ptr<const Module>> make(
        common::BufferView code, const common::Hash256 &digest) const = 0;
  };

}  // namespace sealbox::runtime
