/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "log/logger.hpp"
#include "runtime/module_factory.hpp"

namespace sealbox::runtime::wasm_edge {

  /**
   * Loads and validates modules with the WasmEdge interpreter
   */
  class ModuleFactoryImpl : public ModuleFactory {
   public:
    ModuleFactoryImpl();

    outcome::result<std::shared_ptr<const Module>> make(
        common::BufferView code, const common::Hash256 &digest) const override;

   private:
    log::Logger log_;
  };

}  // namespace sealbox::runtime::wasm_edge
