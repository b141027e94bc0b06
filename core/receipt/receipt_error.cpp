/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "receipt/receipt_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::receipt, ReceiptError, e) {
  using E = sealbox::receipt::ReceiptError;
  switch (e) {
    case E::SIGNATURE_INVALID:
      return "Receipt signature does not verify";
    case E::COMMITMENT_MISMATCH:
      return "Receipt commitments do not match the capsule, input or output";
    case E::MALFORMED_RECEIPT:
      return "Receipt is malformed";
    case E::STALE_RECEIPT:
      return "Receipt is older than the accepted age";
  }
  return "Unknown ReceiptError";
}
