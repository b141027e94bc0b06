/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "receipt/receipt.hpp"

#include <array>

#include "crypto/hasher.hpp"

namespace sealbox::receipt {

  common::Hash256 receiptId(const ExecutionReceipt &receipt,
                            const crypto::Hasher &hasher) {
    std::array<uint8_t, sizeof(receipt.nonce)> nonce{};
    for (size_t i = 0; i < nonce.size(); ++i) {
      nonce[i] = static_cast<uint8_t>(receipt.nonce >> (8 * i));
    }
    return hasher.sha2_256_concat({receipt.capsule_id.view(),
                                   receipt.input_commit.view(),
                                   receipt.output_commit.view(),
                                   receipt.node_id.view(),
                                   nonce});
  }

}  // namespace sealbox::receipt
