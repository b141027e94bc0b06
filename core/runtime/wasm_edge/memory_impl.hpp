/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <wasmedge/wasmedge.h>

#include "log/logger.hpp"
#include "runtime/memory.hpp"
#include "runtime/memory_provider.hpp"

namespace sealbox::runtime::wasm_edge {

  class MemoryImpl final : public Memory {
   public:
    explicit MemoryImpl(WasmEdge_MemoryInstanceContext *mem_instance);

    /**
     * @brief Return the size of the memory
     */
    WasmSize size() const override {
      return static_cast<WasmSize>(byteSize());
    }

    uint32_t pages() const override {
      return WasmEdge_MemoryInstanceGetPageSize(mem_instance_);
    }

    /**
     * Resizes memory to the given size, never shrinks
     * @param new_size
     */
    outcome::result<void> resize(WasmSize new_size) override;

    outcome::result<BytesOut> view(WasmPointer ptr,
                                   WasmSize size) const override;

   private:
    uint64_t byteSize() const {
      return static_cast<uint64_t>(pages()) * kMemoryPageSize;
    }

    WasmEdge_MemoryInstanceContext *mem_instance_;
    log::Logger logger_ = log::createLogger("Memory", "wasmedge");
  };

  /**
   * Memory exported by the capsule itself, known after instantiation
   */
  class InternalMemoryProviderImpl final : public MemoryProvider {
   public:
    InternalMemoryProviderImpl() = default;

    std::optional<std::reference_wrapper<runtime::Memory>> getCurrentMemory()
        const override;

    void setMemory(WasmEdge_MemoryInstanceContext *wasmedge_memory);

   private:
    std::shared_ptr<MemoryImpl> current_memory_;
  };

}  // namespace sealbox::runtime::wasm_edge
