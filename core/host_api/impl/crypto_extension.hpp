/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/random/chacha20_stream.hpp"
#include "host_api/host_environment.hpp"
#include "log/logger.hpp"
#include "runtime/types.hpp"

namespace sealbox::crypto {
  class Hasher;
}  // namespace sealbox::crypto

namespace sealbox::runtime {
  class MemoryProvider;
  class Memory;
}  // namespace sealbox::runtime

namespace sealbox::host_api {
  /**
   * Implements host functions of the `hash` and `random` capabilities
   */
  class CryptoExtension {
   public:
    static constexpr runtime::WasmI32 kHashSize = 32;

    CryptoExtension(
        std::shared_ptr<const runtime::MemoryProvider> memory_provider,
        std::shared_ptr<const crypto::Hasher> hasher,
        const HostEnvironment::Seed &random_seed);

    /**
     * @see HostApi::hash_commit
     */
    runtime::WasmI32 hash_commit(runtime::WasmPointer data,
                                 runtime::WasmSize len,
                                 runtime::WasmPointer out_ptr);

    /**
     * @see HostApi::random_bytes
     */
    runtime::WasmI32 random_bytes(runtime::WasmPointer out_ptr,
                                  runtime::WasmSize len);

   private:
    runtime::Memory &getMemory() const;

    std::shared_ptr<const runtime::MemoryProvider> memory_provider_;
    std::shared_ptr<const crypto::Hasher> hasher_;
    HostEnvironment::Seed random_seed_;
    // created on first use
    std::unique_ptr<crypto::ChaCha20Stream> random_stream_;
    log::Logger logger_;
  };

}  // namespace sealbox::host_api
