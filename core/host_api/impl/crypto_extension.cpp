/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/crypto_extension.hpp"

#include <limits>

#include <boost/assert.hpp>

#include "crypto/hasher.hpp"
#include "host_api/impl/throw_with_error.hpp"
#include "runtime/memory_provider.hpp"

namespace sealbox::host_api {

  CryptoExtension::CryptoExtension(
      std::shared_ptr<const runtime::MemoryProvider> memory_provider,
      std::shared_ptr<const crypto::Hasher> hasher,
      const HostEnvironment::Seed &random_seed)
      : memory_provider_{std::move(memory_provider)},
        hasher_{std::move(hasher)},
        random_seed_{random_seed},
        logger_{log::createLogger("CryptoExtension", "host_api")} {
    BOOST_ASSERT(memory_provider_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);
  }

  runtime::Memory &CryptoExtension::getMemory() const {
    auto memory = memory_provider_->getCurrentMemory();
    if (not memory) {
      throw_with_error(logger_, "Host function called without memory");
    }
    return memory->get();
  }

  runtime::WasmI32 CryptoExtension::hash_commit(runtime::WasmPointer data,
                                                runtime::WasmSize len,
                                                runtime::WasmPointer out_ptr) {
    auto &memory = getMemory();
    auto input = memory.view(data, len);
    if (not input) {
      throw_with_error(
          logger_, "hash_commit: input [{}, +{}) out of bounds", data, len);
    }
    auto hash = hasher_->sha2_256(input.value());
    if (auto res = memory.storeBuffer(out_ptr, hash.view()); not res) {
      throw_with_error(
          logger_, "hash_commit: output at {} out of bounds", out_ptr);
    }
    SL_TRACE(logger_, "hash_commit({} bytes) -> {}", len, hash);
    return kHashSize;
  }

  runtime::WasmI32 CryptoExtension::random_bytes(runtime::WasmPointer out_ptr,
                                                 runtime::WasmSize len) {
    if (len > static_cast<runtime::WasmSize>(
            std::numeric_limits<runtime::WasmI32>::max())) {
      throw_with_error(logger_, "random_bytes: length {} too large", len);
    }
    auto out = getMemory().view(out_ptr, len);
    if (not out) {
      throw_with_error(
          logger_, "random_bytes: output [{}, +{}) out of bounds", out_ptr, len);
    }
    if (not random_stream_) {
      auto stream = crypto::ChaCha20Stream::create(random_seed_);
      if (not stream) {
        throw_with_error(logger_, "random_bytes: {}", stream.error().message());
      }
      random_stream_ = std::move(stream.value());
    }
    if (auto res = random_stream_->fill(out.value()); not res) {
      throw_with_error(logger_, "random_bytes: {}", res.error().message());
    }
    return static_cast<runtime::WasmI32>(len);
  }

}  // namespace sealbox::host_api
