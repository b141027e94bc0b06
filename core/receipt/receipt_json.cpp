/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "receipt/receipt_json.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "receipt/receipt_error.hpp"
#include "receipt/signing_payload.hpp"

namespace sealbox::receipt {

  namespace {
    std::string json2string(rapidjson::Document &document) {
      rapidjson::StringBuffer buffer;
      rapidjson::Writer writer(buffer);
      document.Accept(writer);
      return buffer.GetString();
    }

    const rapidjson::Value *member(const rapidjson::Value &val,
                                   const char *name) {
      auto m = val.FindMember(name);
      if (m == val.MemberEnd()) {
        return nullptr;
      }
      return &m->value;
    }

    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target) {
      auto m = member(val, name);
      if (m != nullptr and m->IsString()) {
        target.assign(m->GetString(), m->GetStringLength());
        return true;
      }
      return false;
    }

    bool load_u64(const rapidjson::Value &val,
                  const char *name,
                  uint64_t &target) {
      auto m = member(val, name);
      if (m != nullptr and m->IsUint64()) {
        target = m->GetUint64();
        return true;
      }
      return false;
    }

    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target) {
      auto m = member(val, name);
      if (m != nullptr and m->IsUint()) {
        target = m->GetUint();
        return true;
      }
      return false;
    }

    bool load_double(const rapidjson::Value &val,
                     const char *name,
                     double &target) {
      auto m = member(val, name);
      if (m != nullptr and m->IsNumber()) {
        target = m->GetDouble();
        return true;
      }
      return false;
    }

    template <typename BlobT>
    bool load_blob(const rapidjson::Value &val,
                   const char *name,
                   BlobT &target) {
      std::string hex;
      if (not load_str(val, name, hex)) {
        return false;
      }
      auto blob = BlobT::fromHex(hex);
      if (not blob) {
        return false;
      }
      target = std::move(blob.value());
      return true;
    }
  }  // namespace

  std::string toJson(const ExecutionReceipt &receipt) {
    rapidjson::Document document;
    document.SetObject();
    auto &allocator = document.GetAllocator();

    auto str_val = [&allocator](const std::string &str) {
      return rapidjson::Value{str.c_str(),
                              static_cast<rapidjson::SizeType>(str.size()),
                              allocator};
    };

    const auto &m = receipt.exec_metrics;
    rapidjson::Value metrics(rapidjson::kObjectType);
    metrics.AddMember("fuel_used", m.fuel_used, allocator)
        .AddMember("memory_mb", m.memory_mb, allocator)
        .AddMember("duration_ms", m.duration_ms, allocator)
        .AddMember("host_calls", m.host_calls, allocator);

    document.AddMember("version", str_val(receipt.version), allocator)
        .AddMember("capsule_id", str_val(receipt.capsule_id.toHex()), allocator)
        .AddMember(
            "input_commit", str_val(receipt.input_commit.toHex()), allocator)
        .AddMember(
            "output_commit", str_val(receipt.output_commit.toHex()), allocator)
        .AddMember("exec_metrics", metrics, allocator)
        .AddMember("node_id", str_val(receipt.node_id.toHex()), allocator)
        .AddMember("nonce", receipt.nonce, allocator)
        .AddMember("timestamp", str_val(receipt.timestamp), allocator)
        .AddMember("signature", str_val(receipt.signature.toHex()), allocator);

    return json2string(document);
  }

  outcome::result<ExecutionReceipt> fromJson(std::string_view json) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    if (document.HasParseError() or not document.IsObject()) {
      return ReceiptError::MALFORMED_RECEIPT;
    }

    ExecutionReceipt receipt;
    auto metrics = member(document, "exec_metrics");
    bool ok = load_str(document, "version", receipt.version)
          and load_blob(document, "capsule_id", receipt.capsule_id)
          and load_blob(document, "input_commit", receipt.input_commit)
          and load_blob(document, "output_commit", receipt.output_commit)
          and metrics != nullptr and metrics->IsObject()
          and load_u64(*metrics, "fuel_used", receipt.exec_metrics.fuel_used)
          and load_double(*metrics, "memory_mb", receipt.exec_metrics.memory_mb)
          and load_u64(
              *metrics, "duration_ms", receipt.exec_metrics.duration_ms)
          and load_u32(*metrics, "host_calls", receipt.exec_metrics.host_calls)
          and load_blob(document, "node_id", receipt.node_id)
          and load_u64(document, "nonce", receipt.nonce)
          and load_str(document, "timestamp", receipt.timestamp)
          and load_blob(document, "signature", receipt.signature);
    if (not ok or not isCanonicalMemoryMb(receipt.exec_metrics.memory_mb)) {
      return ReceiptError::MALFORMED_RECEIPT;
    }
    return receipt;
  }

}  // namespace sealbox::receipt
