/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "receipt/receipt_generator.hpp"

#include <boost/assert.hpp>

#include "crypto/ed25519_provider.hpp"
#include "crypto/hasher.hpp"
#include "receipt/signing_payload.hpp"

namespace sealbox::receipt {

  ReceiptGenerator::ReceiptGenerator(
      std::shared_ptr<const crypto::Hasher> hasher,
      std::shared_ptr<const crypto::Ed25519Provider> ed25519)
      : hasher_{std::move(hasher)},
        ed25519_{std::move(ed25519)},
        logger_{log::createLogger("ReceiptGenerator", "receipt")} {
    BOOST_ASSERT(hasher_ != nullptr);
    BOOST_ASSERT(ed25519_ != nullptr);
  }

  outcome::result<ExecutionReceipt> ReceiptGenerator::makeReceipt(
      const runtime::CapsuleModule &module,
      common::BufferView input,
      common::BufferView output,
      const runtime::ExecMetrics &metrics,
      const crypto::Ed25519Keypair &keypair,
      uint64_t nonce,
      time::TimePoint now) const {
    ExecutionReceipt receipt{
        .version = std::string{kReceiptVersion},
        .capsule_id = module.id,
        .input_commit = hasher_->sha2_256(input),
        .output_commit = hasher_->sha2_256(output),
        .exec_metrics = metrics,
        .node_id = keypair.public_key,
        .nonce = nonce,
        .timestamp = time::formatUtc(now),
        .signature = {},
    };
    receipt.exec_metrics.memory_mb = canonicalMemoryMb(metrics.memory_mb);
    auto payload = signingPayload(receipt);
    OUTCOME_TRY(signature, ed25519_->sign(keypair, payload));
    receipt.signature = signature;

    SL_DEBUG(logger_,
             "Issued receipt {} for capsule {}, nonce {}",
             receiptId(receipt, *hasher_),
             receipt.capsule_id,
             nonce);
    return receipt;
  }

}  // namespace sealbox::receipt
