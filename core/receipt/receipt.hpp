/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "common/blob.hpp"
#include "crypto/ed25519_types.hpp"
#include "runtime/exec_metrics.hpp"

namespace sealbox::crypto {
  class Hasher;
}  // namespace sealbox::crypto

namespace sealbox::receipt {

  inline constexpr std::string_view kReceiptVersion = "1.0.0";

  /**
   * Signed statement that a node ran a capsule on an input and got an
   * output under the recorded resource usage
   */
  struct ExecutionReceipt {
    std::string version{kReceiptVersion};
    /// SHA-256 of the module code
    common::Hash256 capsule_id;
    /// SHA-256 of the input
    common::Hash256 input_commit;
    /// SHA-256 of the output
    common::Hash256 output_commit;
    runtime::ExecMetrics exec_metrics;
    /// public key of the signer
    crypto::Ed25519PublicKey node_id;
    uint64_t nonce = 0;
    /// `YYYY-MM-DDTHH:MM:SS.mmmZ`
    std::string timestamp;
    crypto::Ed25519Signature signature;

    bool operator==(const ExecutionReceipt &) const = default;
  };

  /**
   * Digest identifying a receipt independently of its signature and
   * metrics: capsule, input, output, node and nonce
   */
  common::Hash256 receiptId(const ExecutionReceipt &receipt,
                            const crypto::Hasher &hasher);

}  // namespace sealbox::receipt
