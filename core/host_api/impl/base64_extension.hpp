/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "common/buffer.hpp"
#include "log/logger.hpp"
#include "runtime/types.hpp"

namespace sealbox::runtime {
  class MemoryProvider;
}  // namespace sealbox::runtime

namespace sealbox::host_api {

  /// Standard alphabet with padding
  std::string base64Encode(common::BufferView bytes);

  /// Strict decoding: length multiple of 4, padding only at the end
  std::optional<common::Buffer> base64Decode(std::string_view text);

  /**
   * Implements host functions of the `base64` capability
   */
  class Base64Extension {
   public:
    static constexpr runtime::WasmI32 kInvalidInput = -1;
    static constexpr runtime::WasmI32 kBufferTooSmall = -2;

    explicit Base64Extension(
        std::shared_ptr<const runtime::MemoryProvider> memory_provider);

    /**
     * @see HostApi::base64_encode
     */
    runtime::WasmI32 base64_encode(runtime::WasmPointer data,
                                   runtime::WasmSize len,
                                   runtime::WasmPointer out_ptr,
                                   runtime::WasmSize out_cap);

    /**
     * @see HostApi::base64_decode
     */
    runtime::WasmI32 base64_decode(runtime::WasmPointer data,
                                   runtime::WasmSize len,
                                   runtime::WasmPointer out_ptr,
                                   runtime::WasmSize out_cap);

   private:
    std::shared_ptr<const runtime::MemoryProvider> memory_provider_;
    log::Logger logger_;
  };

}  // namespace sealbox::host_api
