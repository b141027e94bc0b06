/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <span>
#include <string_view>

#include <openssl/crypto.h>

#include "common/blob.hpp"
#include "common/hexutil.hpp"

namespace sealbox::crypto {

  /**
   * Wipes a buffer holding key material when the scope ends
   */
  class WipeOnExit {
   public:
    explicit WipeOnExit(std::span<uint8_t> bytes) : bytes_{bytes} {}

    WipeOnExit(const WipeOnExit &) = delete;
    WipeOnExit &operator=(const WipeOnExit &) = delete;
    WipeOnExit(WipeOnExit &&) = delete;
    WipeOnExit &operator=(WipeOnExit &&) = delete;

    ~WipeOnExit() {
      OPENSSL_cleanse(bytes_.data(), bytes_.size());
    }

   private:
    std::span<uint8_t> bytes_;
  };

  /**
   * Fixed-size secret (private key or seed). Unlike common::Blob it is not
   * printable and its storage is wiped on destruction.
   * @tparam N length in bytes
   * @tparam Tag keeps secrets of equal length apart
   */
  template <size_t N, typename Tag>
  class SecretBlob {
   public:
    SecretBlob() = default;
    SecretBlob(const SecretBlob &) = default;
    SecretBlob &operator=(const SecretBlob &) = default;
    SecretBlob(SecretBlob &&) noexcept = default;
    SecretBlob &operator=(SecretBlob &&) noexcept = default;

    ~SecretBlob() {
      OPENSSL_cleanse(bytes_.data(), bytes_.size());
    }

    bool operator==(const SecretBlob &) const = default;

    static constexpr size_t size() {
      return N;
    }

    static outcome::result<SecretBlob> fromSpan(common::BufferView bytes) {
      if (bytes.size() != N) {
        return common::BlobError::INCORRECT_LENGTH;
      }
      SecretBlob secret;
      std::ranges::copy(bytes, secret.bytes_.begin());
      return secret;
    }

    static outcome::result<SecretBlob> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, common::unhex(hex));
      WipeOnExit wipe{bytes};
      return fromSpan(bytes);
    }

    /// Copies taken from here must be wiped by the caller
    std::span<const uint8_t, N> unsafeBytes() const {
      return bytes_;
    }

   private:
    std::array<uint8_t, N> bytes_{};
  };

}  // namespace sealbox::crypto
