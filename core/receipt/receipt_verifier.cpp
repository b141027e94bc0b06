/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "receipt/receipt_verifier.hpp"

#include <boost/assert.hpp>

#include "common/time.hpp"
#include "crypto/ed25519_provider.hpp"
#include "crypto/hasher.hpp"
#include "receipt/receipt_error.hpp"
#include "receipt/signing_payload.hpp"

namespace sealbox::receipt {

  ReceiptVerifier::ReceiptVerifier(
      std::shared_ptr<const crypto::Hasher> hasher,
      std::shared_ptr<const crypto::Ed25519Provider> ed25519,
      std::shared_ptr<const common::Clock> clock,
      Config config)
      : hasher_{std::move(hasher)},
        ed25519_{std::move(ed25519)},
        clock_{std::move(clock)},
        config_{config},
        logger_{log::createLogger("ReceiptVerifier", "receipt")} {
    BOOST_ASSERT(hasher_ != nullptr);
    BOOST_ASSERT(ed25519_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
  }

  ReceiptVerifier::ReceiptVerifier(
      std::shared_ptr<const crypto::Hasher> hasher,
      std::shared_ptr<const crypto::Ed25519Provider> ed25519,
      std::shared_ptr<const common::Clock> clock)
      : ReceiptVerifier{
          std::move(hasher), std::move(ed25519), std::move(clock), Config{}} {}

  bool ReceiptVerifier::verify(
      const ExecutionReceipt &receipt,
      const crypto::Ed25519PublicKey &public_key) const {
    return checkedVerify(receipt, public_key).has_value();
  }

  bool ReceiptVerifier::verifyNodeSignature(
      const ExecutionReceipt &receipt) const {
    return verify(receipt, receipt.node_id);
  }

  bool ReceiptVerifier::verifyCommitments(const ExecutionReceipt &receipt,
                                          const runtime::CapsuleModule &module,
                                          common::BufferView input,
                                          common::BufferView output) const {
    return checkedVerifyCommitments(receipt, module, input, output)
        .has_value();
  }

  outcome::result<void> ReceiptVerifier::checkedVerify(
      const ExecutionReceipt &receipt,
      const crypto::Ed25519PublicKey &public_key) const {
    if (receipt.version != kReceiptVersion
        or not time::parseUtc(receipt.timestamp)
        or not isCanonicalMemoryMb(receipt.exec_metrics.memory_mb)) {
      SL_DEBUG(logger_,
               "Receipt with version '{}', timestamp '{}' and memory {} MB is "
               "malformed",
               receipt.version,
               receipt.timestamp,
               receipt.exec_metrics.memory_mb);
      return ReceiptError::MALFORMED_RECEIPT;
    }
    auto payload = signingPayload(receipt);
    auto res = ed25519_->verify(receipt.signature, payload, public_key);
    if (not res) {
      SL_DEBUG(logger_,
               "Signature of receipt nonce {} is not checkable: {}",
               receipt.nonce,
               res.error().message());
      return ReceiptError::SIGNATURE_INVALID;
    }
    if (not res.value()) {
      return ReceiptError::SIGNATURE_INVALID;
    }
    return outcome::success();
  }

  outcome::result<void> ReceiptVerifier::checkedVerifyCommitments(
      const ExecutionReceipt &receipt,
      const runtime::CapsuleModule &module,
      common::BufferView input,
      common::BufferView output) const {
    if (receipt.capsule_id != hasher_->sha2_256(module.code)
        or receipt.input_commit != hasher_->sha2_256(input)
        or receipt.output_commit != hasher_->sha2_256(output)) {
      return ReceiptError::COMMITMENT_MISMATCH;
    }
    return outcome::success();
  }

  bool ReceiptVerifier::isRecent(const ExecutionReceipt &receipt) const {
    auto issued = time::parseUtc(receipt.timestamp);
    if (not issued) {
      return false;
    }
    return clock_->now() - issued.value() < config_.max_receipt_age;
  }

  outcome::result<void> ReceiptVerifier::verifyReceipt(
      const ExecutionReceipt &receipt) const {
    OUTCOME_TRY(checkedVerify(receipt, receipt.node_id));
    if (not isRecent(receipt)) {
      SL_DEBUG(logger_,
               "Receipt issued at {} is older than {} s",
               receipt.timestamp,
               config_.max_receipt_age.count());
      return ReceiptError::STALE_RECEIPT;
    }
    return outcome::success();
  }

  std::vector<outcome::result<void>> ReceiptVerifier::verifyReceipts(
      std::span<const ExecutionReceipt> receipts) const {
    std::vector<outcome::result<void>> results;
    results.reserve(receipts.size());
    for (auto &receipt : receipts) {
      results.emplace_back(verifyReceipt(receipt));
    }
    return results;
  }

}  // namespace sealbox::receipt
