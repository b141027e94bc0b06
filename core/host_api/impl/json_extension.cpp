/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/json_extension.hpp"

#include <charconv>

#include <boost/assert.hpp>
#include <rapidjson/document.h>
#include <rapidjson/memorystream.h>
#include <rapidjson/pointer.h>
#include <rapidjson/reader.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "common/buffer_view.hpp"
#include "host_api/impl/throw_with_error.hpp"
#include "runtime/memory_provider.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::host_api, JsonPathError, e) {
  using E = sealbox::host_api::JsonPathError;
  switch (e) {
    case E::MALFORMED_DOCUMENT:
      return "JSON document is malformed";
    case E::MALFORMED_PATH:
      return "JSON path is malformed";
    case E::DOCUMENT_TOO_DEEP:
      return "JSON document is nested too deep";
  }
  return "Unknown JSON path error";
}

namespace sealbox::host_api {

  namespace {
    constexpr unsigned kParseFlags = rapidjson::kParseIterativeFlag;

    /// SAX pass that stops once nesting exceeds kMaxJsonDepth
    struct DepthLimiter
        : rapidjson::BaseReaderHandler<rapidjson::UTF8<>, DepthLimiter> {
      bool Default() {
        return true;
      }
      bool StartObject() {
        return enter();
      }
      bool EndObject(rapidjson::SizeType) {
        --depth;
        return true;
      }
      bool StartArray() {
        return enter();
      }
      bool EndArray(rapidjson::SizeType) {
        --depth;
        return true;
      }

      bool enter() {
        if (++depth > kMaxJsonDepth) {
          too_deep = true;
          return false;
        }
        return true;
      }

      size_t depth = 0;
      bool too_deep = false;
    };

    outcome::result<void> checkDepth(std::string_view document) {
      rapidjson::MemoryStream stream(document.data(), document.size());
      rapidjson::Reader reader;
      DepthLimiter limiter;
      reader.Parse<kParseFlags>(stream, limiter);
      if (limiter.too_deep) {
        return JsonPathError::DOCUMENT_TOO_DEEP;
      }
      if (reader.HasParseError()) {
        return JsonPathError::MALFORMED_DOCUMENT;
      }
      return outcome::success();
    }

    const rapidjson::Value *resolveDotted(const rapidjson::Value &root,
                                          std::string_view path) {
      const rapidjson::Value *current = &root;
      while (true) {
        auto dot = path.find('.');
        auto key = path.substr(0, dot);
        if (current->IsObject()) {
          auto it = current->FindMember(rapidjson::Value{
              rapidjson::StringRef(key.data(), key.size())});
          if (it == current->MemberEnd()) {
            return nullptr;
          }
          current = &it->value;
        } else if (current->IsArray()) {
          rapidjson::SizeType index = 0;
          auto [end, ec] =
              std::from_chars(key.data(), key.data() + key.size(), index);
          if (ec != std::errc{} or end != key.data() + key.size()
              or key.empty() or index >= current->Size()) {
            return nullptr;
          }
          current = &(*current)[index];
        } else {
          return nullptr;
        }
        if (dot == std::string_view::npos) {
          return current;
        }
        path.remove_prefix(dot + 1);
      }
    }
  }  // namespace

  outcome::result<std::optional<std::string>> resolveJsonPath(
      std::string_view document, std::string_view path) {
    // the DOM and its serialization recurse per nesting level
    OUTCOME_TRY(checkDepth(document));
    rapidjson::Document doc;
    doc.Parse<kParseFlags>(document.data(), document.size());
    if (doc.HasParseError()) {
      return JsonPathError::MALFORMED_DOCUMENT;
    }

    const rapidjson::Value *value = nullptr;
    if (path.empty()) {
      value = &doc;
    } else if (path.front() == '/') {
      rapidjson::Pointer pointer(path.data(), path.size());
      if (not pointer.IsValid()) {
        return JsonPathError::MALFORMED_PATH;
      }
      value = pointer.Get(doc);
    } else {
      value = resolveDotted(doc, path);
    }
    if (value == nullptr) {
      return std::nullopt;
    }

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value->Accept(writer);
    return std::string{buffer.GetString(), buffer.GetSize()};
  }

  JsonExtension::JsonExtension(
      std::shared_ptr<const runtime::MemoryProvider> memory_provider)
      : memory_provider_{std::move(memory_provider)},
        logger_{log::createLogger("JsonExtension", "host_api")} {
    BOOST_ASSERT(memory_provider_ != nullptr);
  }

  runtime::WasmI32 JsonExtension::json_path(runtime::WasmPointer data,
                                            runtime::WasmSize data_len,
                                            runtime::WasmPointer path,
                                            runtime::WasmSize path_len,
                                            runtime::WasmPointer out_ptr,
                                            runtime::WasmSize out_cap) {
    auto memory_opt = memory_provider_->getCurrentMemory();
    if (not memory_opt) {
      throw_with_error(logger_, "json_path called without memory");
    }
    auto &memory = memory_opt->get();

    auto document = memory.view(data, data_len);
    if (not document) {
      throw_with_error(
          logger_, "json_path: data [{}, +{}) out of bounds", data, data_len);
    }
    auto path_bytes = memory.view(path, path_len);
    if (not path_bytes) {
      throw_with_error(
          logger_, "json_path: path [{}, +{}) out of bounds", path, path_len);
    }
    auto out = memory.view(out_ptr, out_cap);
    if (not out) {
      throw_with_error(logger_,
                       "json_path: output [{}, +{}) out of bounds",
                       out_ptr,
                       out_cap);
    }

    auto resolved = resolveJsonPath(common::asString(document.value()),
                                    common::asString(path_bytes.value()));
    if (not resolved) {
      throw_with_error(logger_, "json_path: {}", resolved.error().message());
    }
    auto &value = resolved.value();
    if (not value) {
      SL_TRACE(logger_,
               "json_path: '{}' not found",
               common::asString(path_bytes.value()));
      return kNotFound;
    }
    if (value->size() > out_cap) {
      return kBufferTooSmall;
    }
    std::copy(value->begin(), value->end(), out.value().begin());
    return static_cast<runtime::WasmI32>(value->size());
  }

}  // namespace sealbox::host_api
