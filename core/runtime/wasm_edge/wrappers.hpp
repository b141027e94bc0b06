/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <wasmedge/wasmedge.h>

namespace sealbox::runtime::wasm_edge {

  /**
   * Owns a WasmEdge context and releases it with \tparam deleter
   */
  template <typename T, auto deleter>
    requires std::invocable<decltype(deleter), T>
  class Wrapper {
   public:
    Wrapper() : t{} {}

    Wrapper(T t) : t{std::move(t)} {}

    Wrapper(const Wrapper &) = delete;
    Wrapper &operator=(const Wrapper &) = delete;

    Wrapper(Wrapper &&other) noexcept : t{std::exchange(other.t, T{})} {}

    Wrapper &operator=(Wrapper &&other) noexcept {
      if (this != &other) {
        release();
        t = std::exchange(other.t, T{});
      }
      return *this;
    }

    ~Wrapper() {
      release();
    }

    T &raw() {
      return t;
    }

    const T &raw() const {
      return t;
    }

    bool operator==(std::nullptr_t) const
      requires std::is_pointer_v<T>
    {
      return t == nullptr;
    }

   private:
    void release() {
      if constexpr (std::is_pointer_v<T>) {
        if (t != nullptr) {
          deleter(t);
        }
      } else {
        deleter(t);
      }
      t = T{};
    }

    T t;
  };

  using ConfigureContext =
      Wrapper<WasmEdge_ConfigureContext *, WasmEdge_ConfigureDelete>;
  using LoaderContext =
      Wrapper<WasmEdge_LoaderContext *, WasmEdge_LoaderDelete>;
  using StatsContext =
      Wrapper<WasmEdge_StatisticsContext *, WasmEdge_StatisticsDelete>;
  using FunctionTypeContext =
      Wrapper<WasmEdge_FunctionTypeContext *, WasmEdge_FunctionTypeDelete>;
  using ExecutorContext =
      Wrapper<WasmEdge_ExecutorContext *, WasmEdge_ExecutorDelete>;
  using StoreContext = Wrapper<WasmEdge_StoreContext *, WasmEdge_StoreDelete>;
  using ModuleInstanceContext = Wrapper<WasmEdge_ModuleInstanceContext *,
                                        WasmEdge_ModuleInstanceDelete>;
  using String = Wrapper<WasmEdge_String, WasmEdge_StringDelete>;
  using ASTModuleContext =
      Wrapper<WasmEdge_ASTModuleContext *, WasmEdge_ASTModuleDelete>;
  using ValidatorContext =
      Wrapper<WasmEdge_ValidatorContext *, WasmEdge_ValidatorDelete>;
  using AsyncContext = Wrapper<WasmEdge_Async *, WasmEdge_AsyncDelete>;

  inline String makeString(std::string_view s) {
    return WasmEdge_StringCreateByBuffer(s.data(),
                                         static_cast<uint32_t>(s.size()));
  }

  inline std::string toString(const WasmEdge_String &s) {
    return std::string{s.Buf, s.Length};
  }

}  // namespace sealbox::runtime::wasm_edge
