/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <span>
#include <vector>

#include "common/buffer_view.hpp"
#include "common/clock.hpp"
#include "crypto/ed25519_types.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "receipt/receipt.hpp"
#include "runtime/capsule_module.hpp"

namespace sealbox::crypto {
  class Ed25519Provider;
  class Hasher;
}  // namespace sealbox::crypto

namespace sealbox::receipt {

  /**
   * Checks receipts issued by any node.
   * Boolean checks never throw, malformed fields make them return false.
   */
  class ReceiptVerifier {
   public:
    struct Config {
      /// receipts this old or older are stale
      std::chrono::seconds max_receipt_age{3600};
    };

    ReceiptVerifier(std::shared_ptr<const crypto::Hasher> hasher,
                    std::shared_ptr<const crypto::Ed25519Provider> ed25519,
                    std::shared_ptr<const common::Clock> clock,
                    Config config);

    ReceiptVerifier(std::shared_ptr<const crypto::Hasher> hasher,
                    std::shared_ptr<const crypto::Ed25519Provider> ed25519,
                    std::shared_ptr<const common::Clock> clock);

    const Config &config() const {
      return config_;
    }

    /**
     * @return true if \param receipt is signed by \param public_key
     */
    bool verify(const ExecutionReceipt &receipt,
                const crypto::Ed25519PublicKey &public_key) const;

    /**
     * Verifies the signature against the receipt's own node_id
     */
    bool verifyNodeSignature(const ExecutionReceipt &receipt) const;

    /**
     * @return true if the receipt commits to exactly this capsule, input
     * and output
     */
    bool verifyCommitments(const ExecutionReceipt &receipt,
                           const runtime::CapsuleModule &module,
                           common::BufferView input,
                           common::BufferView output) const;

    /**
     * Signature check reporting ReceiptError::MALFORMED_RECEIPT or
     * ReceiptError::SIGNATURE_INVALID
     */
    outcome::result<void> checkedVerify(
        const ExecutionReceipt &receipt,
        const crypto::Ed25519PublicKey &public_key) const;

    /**
     * Commitment check reporting ReceiptError::COMMITMENT_MISMATCH
     */
    outcome::result<void> checkedVerifyCommitments(
        const ExecutionReceipt &receipt,
        const runtime::CapsuleModule &module,
        common::BufferView input,
        common::BufferView output) const;

    /**
     * @return true if the receipt was issued less than max_receipt_age ago
     */
    bool isRecent(const ExecutionReceipt &receipt) const;

    /**
     * Node signature and age, ReceiptError::STALE_RECEIPT for old receipts
     */
    outcome::result<void> verifyReceipt(const ExecutionReceipt &receipt) const;

    /**
     * verifyReceipt applied to each receipt, results in input order
     */
    std::vector<outcome::result<void>> verifyReceipts(
        std::span<const ExecutionReceipt> receipts) const;

   private:
    std::shared_ptr<const crypto::Hasher> hasher_;
    std::shared_ptr<const crypto::Ed25519Provider> ed25519_;
    std::shared_ptr<const common::Clock> clock_;
    Config config_;
    log::Logger logger_;
  };

}  // namespace sealbox::receipt
