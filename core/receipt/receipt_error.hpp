/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace sealbox::receipt {

  enum class ReceiptError {
    SIGNATURE_INVALID = 1,
    COMMITMENT_MISMATCH,
    MALFORMED_RECEIPT,
    STALE_RECEIPT,
  };

}  // namespace sealbox::receipt

OUTCOME_HPP_DECLARE_ERROR(sealbox::receipt, ReceiptError);
