/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace sealbox::runtime {

  using WasmPointer = uint32_t;

  /**
   * @brief Size type is uint32_t because we are working in 32 bit address
   * space
   */
  using WasmSize = uint32_t;

  using WasmI32 = int32_t;
  using WasmI64 = int64_t;

  // https://webassembly.github.io/spec/core/exec/runtime.html#memory-instances
  inline constexpr size_t kMemoryPageSize = 64 * 1024;

  inline constexpr uint32_t kPagesPerMb = (1024 * 1024) / kMemoryPageSize;

  /// Guest input is written to linear memory starting at this address
  inline constexpr WasmPointer kInputOffset = 1024;

  inline constexpr size_t kDefaultMaxIoSize = 1024 * 1024;

  /// Fuel charged for each call of a host function, on top of instructions
  inline constexpr uint64_t kHostCallFuelCost = 10;

  inline constexpr uint64_t sizeToPages(uint64_t size) {
    return (size + kMemoryPageSize - 1) / kMemoryPageSize;
  }

}  // namespace sealbox::runtime
