/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/wasm_edge/register_host_api.hpp"

#include <array>
#include <functional>
#include <span>
#include <stdexcept>
#include <tuple>
#include <unordered_set>

#include <boost/assert.hpp>

#include "runtime/wasm_edge/wrappers.hpp"

namespace sealbox::runtime::wasm_edge {

  namespace {
    template <typename T>
    WasmEdge_ValType get_wasm_type() = delete;

    template <>
    WasmEdge_ValType get_wasm_type<int32_t>() {
      return WasmEdge_ValTypeGenI32();
    }

    template <>
    WasmEdge_ValType get_wasm_type<uint32_t>() {
      return WasmEdge_ValTypeGenI32();
    }

    template <>
    WasmEdge_ValType get_wasm_type<int64_t>() {
      return WasmEdge_ValTypeGenI64();
    }

    template <typename T>
    T get_wasm_value(WasmEdge_Value) = delete;

    template <>
    int32_t get_wasm_value<int32_t>(WasmEdge_Value v) {
      return WasmEdge_ValueGetI32(v);
    }

    template <>
    uint32_t get_wasm_value<uint32_t>(WasmEdge_Value v) {
      return static_cast<uint32_t>(WasmEdge_ValueGetI32(v));
    }

    WasmEdge_Value make_wasm_value(int32_t v) {
      return WasmEdge_ValueGenI32(v);
    }

    WasmEdge_Value make_wasm_value(int64_t v) {
      return WasmEdge_ValueGenI64(v);
    }

    template <typename Ret, typename... Args>
    using HostApiMethod = Ret (host_api::HostApi::*)(Args...);

    template <typename>
    struct HostApiMethodTraits;

    template <typename Ret_, typename... Args_>
    struct HostApiMethodTraits<HostApiMethod<Ret_, Args_...>> {
      using Ret = Ret_;
      using Args = std::tuple<Args_...>;
    };

    template <typename F, typename... Args, size_t... Idxs>
    decltype(auto) call_with_array(
        F f,
        [[maybe_unused]] std::span<const WasmEdge_Value> array,
        std::index_sequence<Idxs...>) {
      return f(get_wasm_value<Args>(array[Idxs])...);
    }

    template <typename F, typename... Args>
    decltype(auto) call_with_array(F f,
                                   std::span<const WasmEdge_Value> array,
                                   std::tuple<Args...>) {
      return call_with_array<F, Args...>(
          f, array, std::make_index_sequence<sizeof...(Args)>());
    }

    /**
     * Host failures are reported to the executor as WasmEdge_Result_Fail,
     * the reason stays with the HostApi for the engine to classify
     */
    template <auto Method>
    WasmEdge_Result host_method_wrapper(void *current_host_api,
                                        const WasmEdge_CallingFrameContext *,
                                        const WasmEdge_Value *params,
                                        WasmEdge_Value *returns) {
      using Ret = typename HostApiMethodTraits<decltype(Method)>::Ret;
      using Args = typename HostApiMethodTraits<decltype(Method)>::Args;
      BOOST_ASSERT(current_host_api);
      auto &host_api = *static_cast<host_api::HostApi *>(current_host_api);

      try {
        Ret res = call_with_array(
            [&host_api](auto... params) mutable -> Ret {
              return std::invoke(Method, host_api, params...);
            },
            std::span{params, std::tuple_size_v<Args>},
            Args{});
        returns[0] = make_wasm_value(res);
      } catch (std::runtime_error &e) {
        host_api.setFailure(e.what());
        return WasmEdge_Result_Fail;
      }
      return WasmEdge_Result_Success;
    }

    template <typename... Args>
    std::array<WasmEdge_ValType, sizeof...(Args)> wasm_types(
        std::tuple<Args...>) {
      return {get_wasm_type<Args>()...};
    }

    template <auto Method>
    void register_host_method(WasmEdge_ModuleInstanceContext *module,
                              host_api::HostApi &host_api,
                              std::string_view name) {
      using Ret = typename HostApiMethodTraits<decltype(Method)>::Ret;
      using Args = typename HostApiMethodTraits<decltype(Method)>::Args;
      auto args = wasm_types(Args{});
      std::array rets{get_wasm_type<Ret>()};

      FunctionTypeContext type = WasmEdge_FunctionTypeCreate(
          args.data(), args.size(), rets.data(), rets.size());
      auto instance = WasmEdge_FunctionInstanceCreate(
          type.raw(), &host_method_wrapper<Method>, &host_api, kHostCallFuelCost);
      String name_str = makeString(name);
      WasmEdge_ModuleInstanceAddFunction(module, name_str.raw(), instance);
    }
  }  // namespace

  void registerHostApi(host_api::HostApi &host_api,
                       const host_api::BoundImports &bound_imports,
                       WasmEdge_ModuleInstanceContext *instance) {
    BOOST_ASSERT(instance);
    using host_api::HostApi;
    using host_api::HostFunctionId;

    std::unordered_set<HostFunctionId> registered;
    for (auto *spec : bound_imports.functions) {
      BOOST_ASSERT(spec != nullptr);
      // a module may import the same function more than once
      if (not registered.insert(spec->id).second) {
        continue;
      }
      switch (spec->id) {
        case HostFunctionId::HASH_COMMIT:
          register_host_method<&HostApi::hash_commit>(
              instance, host_api, spec->name);
          break;
        case HostFunctionId::JSON_PATH:
          register_host_method<&HostApi::json_path>(
              instance, host_api, spec->name);
          break;
        case HostFunctionId::BASE64_ENCODE:
          register_host_method<&HostApi::base64_encode>(
              instance, host_api, spec->name);
          break;
        case HostFunctionId::BASE64_DECODE:
          register_host_method<&HostApi::base64_decode>(
              instance, host_api, spec->name);
          break;
        case HostFunctionId::TIME_NOW_MS:
          register_host_method<&HostApi::time_now_ms>(
              instance, host_api, spec->name);
          break;
        case HostFunctionId::RANDOM_BYTES:
          register_host_method<&HostApi::random_bytes>(
              instance, host_api, spec->name);
          break;
      }
    }
  }

}  // namespace sealbox::runtime::wasm_edge
