/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/base64_extension.hpp"

#include <algorithm>

#include <boost/assert.hpp>
#include <openssl/evp.h>

#include "host_api/impl/throw_with_error.hpp"
#include "runtime/memory_provider.hpp"

namespace sealbox::host_api {

  namespace {
    bool isAlphabet(char c) {
      return (c >= 'A' and c <= 'Z') or (c >= 'a' and c <= 'z')
          or (c >= '0' and c <= '9') or c == '+' or c == '/';
    }
  }  // namespace

  std::string base64Encode(common::BufferView bytes) {
    // EVP_EncodeBlock appends a terminating NUL
    std::string text(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    auto written = EVP_EncodeBlock(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<unsigned char *>(text.data()),
        bytes.data(),
        static_cast<int>(bytes.size()));
    text.resize(static_cast<size_t>(written));
    return text;
  }

  std::optional<common::Buffer> base64Decode(std::string_view text) {
    if (text.size() % 4 != 0) {
      return std::nullopt;
    }
    if (text.empty()) {
      return common::Buffer{};
    }
    size_t padding = 0;
    if (text.back() == '=') {
      padding = text[text.size() - 2] == '=' ? 2 : 1;
    }
    auto body = text.substr(0, text.size() - padding);
    if (not std::ranges::all_of(body, isAlphabet)) {
      return std::nullopt;
    }
    common::Buffer bytes(text.size() / 4 * 3);
    auto decoded = EVP_DecodeBlock(
        bytes.data(),
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<const unsigned char *>(text.data()),
        static_cast<int>(text.size()));
    if (decoded < 0) {
      return std::nullopt;
    }
    // EVP_DecodeBlock counts padding as zero bytes
    bytes.resize(static_cast<size_t>(decoded) - padding);
    return bytes;
  }

  Base64Extension::Base64Extension(
      std::shared_ptr<const runtime::MemoryProvider> memory_provider)
      : memory_provider_{std::move(memory_provider)},
        logger_{log::createLogger("Base64Extension", "host_api")} {
    BOOST_ASSERT(memory_provider_ != nullptr);
  }

  runtime::WasmI32 Base64Extension::base64_encode(runtime::WasmPointer data,
                                                  runtime::WasmSize len,
                                                  runtime::WasmPointer out_ptr,
                                                  runtime::WasmSize out_cap) {
    auto memory_opt = memory_provider_->getCurrentMemory();
    if (not memory_opt) {
      throw_with_error(logger_, "base64_encode called without memory");
    }
    auto &memory = memory_opt->get();
    auto input = memory.view(data, len);
    auto out = memory.view(out_ptr, out_cap);
    if (not input or not out) {
      throw_with_error(logger_,
                       "base64_encode: arguments out of bounds, input [{}, "
                       "+{}), output [{}, +{})",
                       data,
                       len,
                       out_ptr,
                       out_cap);
    }
    auto text = base64Encode(input.value());
    if (text.size() > out_cap) {
      return kBufferTooSmall;
    }
    std::ranges::copy(text, out.value().begin());
    return static_cast<runtime::WasmI32>(text.size());
  }

  runtime::WasmI32 Base64Extension::base64_decode(runtime::WasmPointer data,
                                                  runtime::WasmSize len,
                                                  runtime::WasmPointer out_ptr,
                                                  runtime::WasmSize out_cap) {
    auto memory_opt = memory_provider_->getCurrentMemory();
    if (not memory_opt) {
      throw_with_error(logger_, "base64_decode called without memory");
    }
    auto &memory = memory_opt->get();
    auto input = memory.view(data, len);
    auto out = memory.view(out_ptr, out_cap);
    if (not input or not out) {
      throw_with_error(logger_,
                       "base64_decode: arguments out of bounds, input [{}, "
                       "+{}), output [{}, +{})",
                       data,
                       len,
                       out_ptr,
                       out_cap);
    }
    auto bytes = base64Decode(common::asString(input.value()));
    if (not bytes) {
      return kInvalidInput;
    }
    if (bytes->size() > out_cap) {
      return kBufferTooSmall;
    }
    std::ranges::copy(*bytes, out.value().begin());
    return static_cast<runtime::WasmI32>(bytes->size());
  }

}  // namespace sealbox::host_api
