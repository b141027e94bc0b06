/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "receipt/receipt_json.hpp"

#include <gtest/gtest.h>

#include "receipt/receipt_error.hpp"
#include "testutil/outcome.hpp"

using namespace sealbox::receipt;

namespace {
  ExecutionReceipt sampleReceipt() {
    ExecutionReceipt receipt;
    receipt.capsule_id[0] = 0xca;
    receipt.input_commit[1] = 0x1e;
    receipt.output_commit[31] = 0x0f;
    receipt.exec_metrics = {.fuel_used = 98765,
                            .memory_mb = 0.125,
                            .duration_ms = 12,
                            .host_calls = 3};
    receipt.node_id[5] = 0x42;
    receipt.nonce = 18'446'744'073'709'551'615ull;
    receipt.timestamp = "2023-11-14T22:13:20.123Z";
    receipt.signature[63] = 0xff;
    return receipt;
  }
}  // namespace

/**
 * @given a receipt with extreme nonce and non-zero binary fields
 * @when serialized and parsed back
 * @then every field is preserved
 */
TEST(ReceiptJsonTest, ParsesWhatItWrites) {
  auto receipt = sampleReceipt();
  auto json = toJson(receipt);
  EXPECT_NE(json.find(R"("version":"1.0.0")"), std::string::npos);
  EXPECT_NE(json.find(R"("nonce":18446744073709551615)"), std::string::npos);
  EXPECT_NE(json.find(R"("host_calls":3)"), std::string::npos);
  EXPECT_NE(json.find(receipt.capsule_id.toHex()), std::string::npos);

  EXPECT_OUTCOME_TRUE(parsed, fromJson(json));
  EXPECT_EQ(parsed, receipt);
}

TEST(ReceiptJsonTest, RejectsMalformedDocuments) {
  auto json = toJson(sampleReceipt());
  auto replace = [&](std::string_view from, std::string_view to) {
    auto copy = json;
    auto pos = copy.find(from);
    EXPECT_NE(pos, std::string::npos) << from;
    return copy.replace(pos, from.size(), to);
  };

  for (auto &bad : {
           std::string{""},
           std::string{"[]"},
           std::string{"{\"version\":"},
           replace(R"("version":"1.0.0")", R"("version":1)"),
           replace(R"("nonce":)", R"("nonce":-)"),
           replace(R"("host_calls":3)", R"("host_calls":4294967296)"),
           replace(R"("fuel_used":98765)", R"("fuel_used":"98765")"),
           replace(R"("exec_metrics":{)", R"("exec_metrics":[{)"),
           replace(R"("capsule_id":"ca)", R"("capsule_id":"zz)"),
           replace(R"("capsule_id":"ca)", R"("capsule_id":")"),
           replace(R"("signature":)", R"("sig":)"),
           replace(R"("memory_mb":0.125)", R"("memory_mb":0.1251)"),
       }) {
    EXPECT_EC(fromJson(bad), ReceiptError::MALFORMED_RECEIPT);
  }
}
