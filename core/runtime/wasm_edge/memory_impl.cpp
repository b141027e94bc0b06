/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/wasm_edge/memory_impl.hpp"

#include <boost/assert.hpp>

#include "runtime/common/memory_error.hpp"

namespace sealbox::runtime::wasm_edge {

  MemoryImpl::MemoryImpl(WasmEdge_MemoryInstanceContext *mem_instance)
      : mem_instance_{mem_instance} {
    BOOST_ASSERT(mem_instance_ != nullptr);
    SL_TRACE(logger_,
             "Created memory wrapper {} for internal instance {}",
             fmt::ptr(this),
             fmt::ptr(mem_instance_));
  }

  outcome::result<void> MemoryImpl::resize(WasmSize new_size) {
    if (new_size <= byteSize()) {
      return outcome::success();
    }
    auto old_page_num = pages();
    auto new_page_num = static_cast<uint32_t>(sizeToPages(new_size));
    auto res = WasmEdge_MemoryInstanceGrowPage(mem_instance_,
                                               new_page_num - old_page_num);
    if (not WasmEdge_ResultOK(res)) {
      SL_DEBUG(logger_,
               "Failed to grow memory from {} to {} pages: {}",
               old_page_num,
               new_page_num,
               WasmEdge_ResultGetMessage(res));
      return MemoryError::GROW_FAILED;
    }
    SL_TRACE(logger_,
             "Grow memory to {} pages ({} bytes)",
             new_page_num,
             new_size);
    return outcome::success();
  }

  outcome::result<BytesOut> MemoryImpl::view(WasmPointer ptr,
                                             WasmSize size) const {
    if (not rangeInBounds(ptr, size, byteSize())) {
      return MemoryError::OUT_OF_BOUNDS;
    }
    if (size == 0) {
      return BytesOut{};
    }
    auto raw = WasmEdge_MemoryInstanceGetPointer(mem_instance_, ptr, size);
    if (raw == nullptr) {
      return MemoryError::OUT_OF_BOUNDS;
    }
    return BytesOut{raw, size};
  }

  std::optional<std::reference_wrapper<runtime::Memory>>
  InternalMemoryProviderImpl::getCurrentMemory() const {
    if (current_memory_) {
      return std::reference_wrapper<runtime::Memory>(*current_memory_);
    }
    return std::nullopt;
  }

  void InternalMemoryProviderImpl::setMemory(
      WasmEdge_MemoryInstanceContext *wasmedge_memory) {
    current_memory_ = std::make_shared<MemoryImpl>(wasmedge_memory);
  }

}  // namespace sealbox::runtime::wasm_edge
