/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/buffer_view.hpp"
#include "common/time.hpp"
#include "crypto/ed25519_types.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "receipt/receipt.hpp"
#include "runtime/capsule_module.hpp"
#include "runtime/exec_metrics.hpp"

namespace sealbox::crypto {
  class Ed25519Provider;
  class Hasher;
}  // namespace sealbox::crypto

namespace sealbox::receipt {

  /**
   * Commits to an execution and signs the commitment with the node key
   */
  class ReceiptGenerator {
   public:
    ReceiptGenerator(std::shared_ptr<const crypto::Hasher> hasher,
                     std::shared_ptr<const crypto::Ed25519Provider> ed25519);

    /**
     * @param keypair node key, its public part becomes node_id
     * @param nonce caller-issued, unique per signer
     * @param now moment the receipt is issued at
     */
    outcome::result<ExecutionReceipt> makeReceipt(
        const runtime::CapsuleModule &module,
        common::BufferView input,
        common::BufferView output,
        const runtime::ExecMetrics &metrics,
        const crypto::Ed25519Keypair &keypair,
        uint64_t nonce,
        time::TimePoint now) const;

   private:
    std::shared_ptr<const crypto::Hasher> hasher_;
    std::shared_ptr<const crypto::Ed25519Provider> ed25519_;
    log::Logger logger_;
  };

}  // namespace sealbox::receipt
