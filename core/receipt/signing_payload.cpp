/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "receipt/signing_payload.hpp"

#include <charconv>
#include <cmath>
#include <limits>

#include <fmt/format.h>
#include <scale/scale.hpp>

namespace sealbox::receipt {

  std::string formatMemoryMb(double memory_mb) {
    return fmt::format("{:.3f}", memory_mb);
  }

  double canonicalMemoryMb(double memory_mb) {
    auto text = formatMemoryMb(memory_mb);
    double value = std::numeric_limits<double>::quiet_NaN();
    auto [end, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} or end != text.data() + text.size()) {
      return std::numeric_limits<double>::quiet_NaN();
    }
    return value;
  }

  bool isCanonicalMemoryMb(double memory_mb) {
    return std::isfinite(memory_mb)
       and memory_mb == canonicalMemoryMb(memory_mb);
  }

  common::Buffer signingPayload(const ExecutionReceipt &receipt) {
    const auto &metrics = receipt.exec_metrics;
    scale::ScaleEncoderStream s;
    s << kReceiptDomain << std::string_view{receipt.version}
      << receipt.capsule_id.asArray() << receipt.input_commit.asArray()
      << receipt.output_commit.asArray() << metrics.fuel_used
      << formatMemoryMb(metrics.memory_mb) << metrics.duration_ms
      << metrics.host_calls << receipt.node_id.asArray() << receipt.nonce
      << std::string_view{receipt.timestamp};
    return s.to_vector();
  }

}  // namespace sealbox::receipt
