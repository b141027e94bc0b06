/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "outcome/outcome.hpp"
#include "receipt/receipt.hpp"

namespace sealbox::receipt {

  /**
   * Compact JSON record of the receipt, binary fields hex encoded
   */
  std::string toJson(const ExecutionReceipt &receipt);

  /**
   * Parses the record produced by toJson.
   * Any missing or ill-typed field, or memory_mb with more than three
   * decimals, gives ReceiptError::MALFORMED_RECEIPT.
   */
  outcome::result<ExecutionReceipt> fromJson(std::string_view json);

}  // namespace sealbox::receipt
