/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/host_api_impl.hpp"

#include "host_api/impl/throw_with_error.hpp"

namespace sealbox::host_api {

  HostApiImpl::HostApiImpl(
      std::shared_ptr<const runtime::MemoryProvider> memory_provider,
      std::shared_ptr<const crypto::Hasher> hasher,
      BoundImports bound_imports,
      const HostEnvironment &environment)
      : bound_imports_{std::move(bound_imports)},
        environment_{environment},
        crypto_ext_{memory_provider, std::move(hasher), environment.random_seed},
        json_ext_{memory_provider},
        base64_ext_{memory_provider},
        logger_{log::createLogger("HostApi", "host_api")} {}

  void HostApiImpl::enter(HostFunctionId id,
                          Capability capability,
                          std::string_view name) {
    // engine registers bound functions only, this is a second line check
    if (not bound_imports_.contains(id)) {
      throw_with_error(logger_, "Host function {} is not bound", name);
    }
    ++host_calls_;
    access_log_.append(capability, name);
  }

  runtime::WasmI32 HostApiImpl::hash_commit(runtime::WasmPointer data,
                                            runtime::WasmSize len,
                                            runtime::WasmPointer out_ptr) {
    enter(HostFunctionId::HASH_COMMIT, Capability::Hash, "hash_commit");
    return crypto_ext_.hash_commit(data, len, out_ptr);
  }

  runtime::WasmI32 HostApiImpl::json_path(runtime::WasmPointer data,
                                          runtime::WasmSize data_len,
                                          runtime::WasmPointer path,
                                          runtime::WasmSize path_len,
                                          runtime::WasmPointer out_ptr,
                                          runtime::WasmSize out_cap) {
    enter(HostFunctionId::JSON_PATH, Capability::Json, "json_path");
    return json_ext_.json_path(
        data, data_len, path, path_len, out_ptr, out_cap);
  }

  runtime::WasmI32 HostApiImpl::base64_encode(runtime::WasmPointer data,
                                              runtime::WasmSize len,
                                              runtime::WasmPointer out_ptr,
                                              runtime::WasmSize out_cap) {
    enter(HostFunctionId::BASE64_ENCODE, Capability::Base64, "base64_encode");
    return base64_ext_.base64_encode(data, len, out_ptr, out_cap);
  }

  runtime::WasmI32 HostApiImpl::base64_decode(runtime::WasmPointer data,
                                              runtime::WasmSize len,
                                              runtime::WasmPointer out_ptr,
                                              runtime::WasmSize out_cap) {
    enter(HostFunctionId::BASE64_DECODE, Capability::Base64, "base64_decode");
    return base64_ext_.base64_decode(data, len, out_ptr, out_cap);
  }

  runtime::WasmI64 HostApiImpl::time_now_ms() {
    enter(HostFunctionId::TIME_NOW_MS, Capability::Time, "time_now_ms");
    return static_cast<runtime::WasmI64>(environment_.time_ms);
  }

  runtime::WasmI32 HostApiImpl::random_bytes(runtime::WasmPointer out_ptr,
                                             runtime::WasmSize len) {
    enter(HostFunctionId::RANDOM_BYTES, Capability::Random, "random_bytes");
    return crypto_ext_.random_bytes(out_ptr, len);
  }

  void HostApiImpl::setFailure(std::string reason) {
    // the first failure aborts the execution, later ones are not expected
    if (not failure_) {
      failure_ = std::move(reason);
    }
  }

}  // namespace sealbox::host_api
