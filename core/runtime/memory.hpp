/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <span>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"
#include "runtime/ptr_size.hpp"
#include "runtime/types.hpp"

namespace sealbox::runtime {
  using BytesOut = std::span<uint8_t>;

  /// Whether [ptr, ptr + len) fits into a memory of `memory_size` bytes
  inline bool rangeInBounds(WasmPointer ptr,
                            WasmSize len,
                            uint64_t memory_size) {
    return static_cast<uint64_t>(ptr) + len <= memory_size;
  }

  /**
   * An interface for a particular WASM engine memory implementation.
   * Every access is bounds checked against the current memory size.
   */
  class Memory {
   public:
    virtual ~Memory() = default;

    /**
     * @brief Return the size of the memory in bytes
     */
    virtual WasmSize size() const = 0;

    virtual uint32_t pages() const = 0;

    /**
     * Grows memory so that it is at least \param new_size bytes long
     */
    virtual outcome::result<void> resize(WasmSize new_size) = 0;

    virtual outcome::result<BytesOut> view(WasmPointer ptr,
                                           WasmSize size) const = 0;

    outcome::result<BytesOut> view(PtrSize ptr_size) const {
      return view(ptr_size.ptr, ptr_size.size);
    }

    outcome::result<common::Buffer> loadN(WasmPointer ptr,
                                          WasmSize size) const {
      OUTCOME_TRY(bytes, view(ptr, size));
      return common::Buffer{bytes.begin(), bytes.end()};
    }

    outcome::result<void> storeBuffer(WasmPointer ptr,
                                      common::BufferView bytes) {
      OUTCOME_TRY(out, view(ptr, static_cast<WasmSize>(bytes.size())));
      std::copy(bytes.begin(), bytes.end(), out.begin());
      return outcome::success();
    }
  };

}  // namespace sealbox::runtime
