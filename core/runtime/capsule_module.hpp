/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/hasher.hpp"

namespace sealbox::runtime {

  /**
   * Capsule code together with its content identifier
   */
  struct CapsuleModule {
    common::Buffer code;
    /// SHA-256 of code
    common::Hash256 id;

    static CapsuleModule load(common::Buffer code,
                              const crypto::Hasher &hasher) {
      auto id = hasher.sha2_256(code);
      return CapsuleModule{std::move(code), id};
    }
  };

}  // namespace sealbox::runtime
