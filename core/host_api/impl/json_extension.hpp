/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "runtime/types.hpp"

namespace sealbox::runtime {
  class MemoryProvider;
}  // namespace sealbox::runtime

namespace sealbox::host_api {

  enum class JsonPathError : uint8_t {
    MALFORMED_DOCUMENT = 1,
    MALFORMED_PATH,
    DOCUMENT_TOO_DEEP,
  };

  /// Deepest nesting of arrays and objects json_path accepts
  inline constexpr size_t kMaxJsonDepth = 128;

  /**
   * Resolves \param path in the JSON text \param document.
   * A path starting with '/' is a JSON Pointer (RFC 6901), any other path
   * is a list of keys separated by '.', where numeric keys index arrays.
   * An empty path selects the whole document. Documents nested deeper than
   * kMaxJsonDepth are rejected before they are built.
   * @return compact serialization of the value, or nullopt if the path does
   * not resolve
   */
  outcome::result<std::optional<std::string>> resolveJsonPath(
      std::string_view document, std::string_view path);

  /**
   * Implements host functions of the `json` capability
   */
  class JsonExtension {
   public:
    static constexpr runtime::WasmI32 kNotFound = -1;
    static constexpr runtime::WasmI32 kBufferTooSmall = -2;

    explicit JsonExtension(
        std::shared_ptr<const runtime::MemoryProvider> memory_provider);

    /**
     * @see HostApi::json_path
     */
    runtime::WasmI32 json_path(runtime::WasmPointer data,
                               runtime::WasmSize data_len,
                               runtime::WasmPointer path,
                               runtime::WasmSize path_len,
                               runtime::WasmPointer out_ptr,
                               runtime::WasmSize out_cap);

   private:
    std::shared_ptr<const runtime::MemoryProvider> memory_provider_;
    log::Logger logger_;
  };

}  // namespace sealbox::host_api

OUTCOME_HPP_DECLARE_ERROR(sealbox::host_api, JsonPathError);
