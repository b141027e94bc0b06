/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>

#include "runtime/memory.hpp"

namespace sealbox::runtime {

  /**
   * Gives host functions access to the memory of the running instance.
   * The memory is known only after the instance is created, so it is empty
   * until the engine sets it.
   */
  class MemoryProvider {
   public:
    virtual ~MemoryProvider() = default;

    virtual std::optional<std::reference_wrapper<runtime::Memory>>
    getCurrentMemory() const = 0;
  };

}  // namespace sealbox::runtime
