/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>
#include <string_view>
#include <vector>

#include <wabt/binary-writer.h>
#include <wabt/ir.h>
#include <wabt/stream.h>
#include <wabt/wast-lexer.h>
#include <wabt/wast-parser.h>

namespace testutil {

  inline std::unique_ptr<wabt::Module> watToModule(std::string_view wat) {
    wabt::Errors errors;
    std::unique_ptr<wabt::WastLexer> lexer =
        wabt::WastLexer::CreateBufferLexer("", wat.data(), wat.size(), &errors);

    std::unique_ptr<wabt::Module> module;
    wabt::WastParseOptions parse_wast_options{{}};
    auto result = wabt::ParseWatModule(
        lexer.get(), &module, &errors, &parse_wast_options);
    if (wabt::Failed(result) or module == nullptr) {
      throw std::runtime_error{"Failed to parse module"};
    }
    return module;
  }

  /**
   * Compiles WebAssembly text to a binary module
   */
  inline std::vector<uint8_t> watToWasm(std::string_view wat) {
    auto module = watToModule(wat);
    wabt::MemoryStream stream;
    if (wabt::Failed(wabt::WriteBinaryModule(
            &stream,
            module.get(),
            wabt::WriteBinaryOptions{{}, true, false, false}))) {
      throw std::runtime_error{"Failed to write binary wasm"};
    }
    return std::move(stream.output_buffer().data);
  }

}  // namespace testutil
