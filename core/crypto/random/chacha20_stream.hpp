/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>

#include "outcome/outcome.hpp"

struct evp_cipher_ctx_st;

namespace sealbox::crypto {

  /**
   * Deterministic byte stream: the ChaCha20 keystream for a 32-byte seed
   * with zero nonce and zero initial counter. Consecutive reads continue the
   * keystream, so two streams with the same seed yield the same bytes no
   * matter how the reads are split.
   */
  class ChaCha20Stream {
   public:
    using Seed = std::array<uint8_t, 32>;

    enum class Error { CIPHER_INIT_FAILED = 1, CIPHER_UPDATE_FAILED };

    static outcome::result<std::unique_ptr<ChaCha20Stream>> create(
        const Seed &seed);

    ChaCha20Stream(const ChaCha20Stream &) = delete;
    ChaCha20Stream &operator=(const ChaCha20Stream &) = delete;
    ~ChaCha20Stream();

    outcome::result<void> fill(std::span<uint8_t> out);

   private:
    explicit ChaCha20Stream(evp_cipher_ctx_st *ctx);

    evp_cipher_ctx_st *ctx_;
  };

}  // namespace sealbox::crypto

OUTCOME_HPP_DECLARE_ERROR(sealbox::crypto, ChaCha20Stream::Error);
