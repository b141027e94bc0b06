/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <initializer_list>

#include "common/blob.hpp"
#include "common/buffer_view.hpp"

namespace sealbox::crypto {

  /**
   * Content digest used for capsule identifiers, input/output commitments
   * and the `hash_commit` host function
   */
  class Hasher {
   public:
    using Hash256 = common::Hash256;

    virtual ~Hasher() = default;

    /// SHA-256 of the bytes
    virtual Hash256 sha2_256(common::BufferView data) const = 0;

    /// SHA-256 of the parts concatenated in order
    virtual Hash256 sha2_256_concat(
        std::initializer_list<common::BufferView> parts) const = 0;
  };

}  // namespace sealbox::crypto
