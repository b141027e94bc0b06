/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/random/chacha20_stream.hpp"

#include <algorithm>
#include <limits>

#include <openssl/evp.h>

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::crypto, ChaCha20Stream::Error, e) {
  using E = sealbox::crypto::ChaCha20Stream::Error;
  switch (e) {
    case E::CIPHER_INIT_FAILED:
      return "Failed to initialize ChaCha20 cipher";
    case E::CIPHER_UPDATE_FAILED:
      return "Failed to produce ChaCha20 keystream";
  }
  return "Unknown error in ChaCha20 stream";
}

namespace sealbox::crypto {

  outcome::result<std::unique_ptr<ChaCha20Stream>> ChaCha20Stream::create(
      const Seed &seed) {
    auto *ctx = EVP_CIPHER_CTX_new();
    if (ctx == nullptr) {
      return Error::CIPHER_INIT_FAILED;
    }
    // 4-byte little-endian block counter followed by 12-byte nonce
    const std::array<uint8_t, 16> iv{};
    if (EVP_EncryptInit_ex(ctx, EVP_chacha20(), nullptr, seed.data(), iv.data())
        != 1) {
      EVP_CIPHER_CTX_free(ctx);
      return Error::CIPHER_INIT_FAILED;
    }
    return std::unique_ptr<ChaCha20Stream>(new ChaCha20Stream(ctx));
  }

  ChaCha20Stream::ChaCha20Stream(evp_cipher_ctx_st *ctx) : ctx_{ctx} {}

  ChaCha20Stream::~ChaCha20Stream() {
    EVP_CIPHER_CTX_free(ctx_);
  }

  outcome::result<void> ChaCha20Stream::fill(std::span<uint8_t> out) {
    // keystream is the encryption of zeroes
    std::ranges::fill(out, 0);
    constexpr size_t kChunk = std::numeric_limits<int>::max();
    while (not out.empty()) {
      auto chunk = std::min(out.size(), kChunk);
      int written = 0;
      if (EVP_EncryptUpdate(ctx_,
                            out.data(),
                            &written,
                            out.data(),
                            static_cast<int>(chunk))
              != 1
          or static_cast<size_t>(written) != chunk) {
        return Error::CIPHER_UPDATE_FAILED;
      }
      out = out.subspan(chunk);
    }
    return outcome::success();
  }

}  // namespace sealbox::crypto
