/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/buffer.hpp"
#include "receipt/receipt.hpp"

namespace sealbox::receipt {

  /// Domain separation tag heading every signed payload
  inline constexpr std::string_view kReceiptDomain = "SEALBOX_RECEIPT_V1";

  /**
   * Text form of memory usage covered by the signature, three decimals
   */
  std::string formatMemoryMb(double memory_mb);

  /**
   * The double that formatMemoryMb renders exactly, i.e. memory_mb rounded
   * to three decimals. Receipts carry only such values, so that every bit of
   * the field is covered by the signature.
   */
  double canonicalMemoryMb(double memory_mb);

  /// Finite and equal to its own canonicalMemoryMb
  bool isCanonicalMemoryMb(double memory_mb);

  /**
   * SCALE encoding of every receipt field except the signature, prefixed
   * with kReceiptDomain
   */
  common::Buffer signingPayload(const ExecutionReceipt &receipt);

}  // namespace sealbox::receipt
