/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace sealbox::crypto {

  namespace {
    using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    // EVP only fails on allocation or with a broken provider setup
    void ensure(int openssl_result) {
      if (openssl_result != 1) {
        throw std::runtime_error("OpenSSL SHA-256 digest failed");
      }
    }
  }  // namespace

  HasherImpl::Hash256 HasherImpl::sha2_256(common::BufferView data) const {
    return sha2_256_concat({data});
  }

  HasherImpl::Hash256 HasherImpl::sha2_256_concat(
      std::initializer_list<common::BufferView> parts) const {
    DigestCtx ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (ctx == nullptr) {
      throw std::bad_alloc{};
    }
    ensure(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr));
    for (auto part : parts) {
      ensure(EVP_DigestUpdate(ctx.get(), part.data(), part.size()));
    }
    Hash256 digest;
    unsigned int length = 0;
    ensure(EVP_DigestFinal_ex(ctx.get(), digest.data(), &length));
    return digest;
  }

}  // namespace sealbox::crypto
