/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace sealbox::crypto {

  /// OpenSSL EVP backed hasher
  class HasherImpl final : public Hasher {
   public:
    Hash256 sha2_256(common::BufferView data) const override;

    Hash256 sha2_256_concat(
        std::initializer_list<common::BufferView> parts) const override;
  };

}  // namespace sealbox::crypto
