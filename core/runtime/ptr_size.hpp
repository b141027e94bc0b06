/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "runtime/types.hpp"

namespace sealbox::runtime {
  /**
   * Result of the capsule entry point is an i32 where the lower 16 bits are
   * the address and the upper 16 bits are the size of the returned buffer.
   */
  struct PtrSize {
    constexpr PtrSize() = default;

    constexpr PtrSize(WasmPointer ptr, WasmSize size) : ptr{ptr}, size{size} {}

    /**
     * @brief splits the packed result, the value is read as unsigned
     */
    static constexpr PtrSize unpack(WasmI32 packed) {
      auto value = static_cast<uint32_t>(packed);
      return PtrSize{value & 0xFFFFu, value >> 16u};
    }

    /**
     * @brief makes packed pointer-size value, both parts must fit 16 bits
     */
    constexpr WasmI32 pack() const {
      return static_cast<WasmI32>((size << 16u) | (ptr & 0xFFFFu));
    }

    bool operator==(const PtrSize &rhs) const = default;

    WasmPointer ptr = 0u;  ///< address of buffer
    WasmSize size = 0u;    ///< length of buffer
  };

}  // namespace sealbox::runtime
