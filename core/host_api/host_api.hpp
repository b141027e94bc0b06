/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "host_api/access_log.hpp"
#include "runtime/types.hpp"

namespace sealbox::host_api {
  /**
   * Host functions a capsule may import from the `env` namespace.
   * One instance serves exactly one execution.
   *
   * Negative results are soft errors returned to the guest. Hard failures
   * (out of bounds pointers, malformed arguments) are thrown as
   * std::runtime_error and abort the execution.
   */
  class HostApi {
   public:
    virtual ~HostApi() = default;

    /**
     * Writes SHA-256 of the region to \param out_ptr
     * @return 32, the number of bytes written
     */
    virtual runtime::WasmI32 hash_commit(runtime::WasmPointer data,
                                         runtime::WasmSize len,
                                         runtime::WasmPointer out_ptr) = 0;

    /**
     * Resolves \param path (JSON Pointer, or dot separated keys when it does
     * not start with '/') in the JSON document and writes the compact
     * serialization of the value to \param out_ptr
     * @return length written, -1 if the path does not resolve, -2 if the
     * value does not fit \param out_cap
     */
    virtual runtime::WasmI32 json_path(runtime::WasmPointer data,
                                       runtime::WasmSize data_len,
                                       runtime::WasmPointer path,
                                       runtime::WasmSize path_len,
                                       runtime::WasmPointer out_ptr,
                                       runtime::WasmSize out_cap) = 0;

    /**
     * @return length of the padded base64 text or -2 if it does not fit
     */
    virtual runtime::WasmI32 base64_encode(runtime::WasmPointer data,
                                           runtime::WasmSize len,
                                           runtime::WasmPointer out_ptr,
                                           runtime::WasmSize out_cap) = 0;

    /**
     * @return decoded length, -1 on invalid input, -2 if it does not fit
     */
    virtual runtime::WasmI32 base64_decode(runtime::WasmPointer data,
                                           runtime::WasmSize len,
                                           runtime::WasmPointer out_ptr,
                                           runtime::WasmSize out_cap) = 0;

    /**
     * @return injected time in milliseconds since unix epoch
     */
    virtual runtime::WasmI64 time_now_ms() = 0;

    /**
     * Fills \param len bytes at \param out_ptr from the seeded stream
     * @return \param len
     */
    virtual runtime::WasmI32 random_bytes(runtime::WasmPointer out_ptr,
                                          runtime::WasmSize len) = 0;

    /// Number of host function calls made so far
    virtual uint32_t hostCalls() const = 0;

    virtual const AccessLog &accessLog() const = 0;

    /// Records the reason of a hard failure of a host function
    virtual void setFailure(std::string reason) = 0;

    virtual const std::optional<std::string> &failure() const = 0;
  };

}  // namespace sealbox::host_api
