/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "host_api/host_api.hpp"

#include <memory>

#include "host_api/capability_sandbox.hpp"
#include "host_api/host_environment.hpp"
#include "host_api/impl/base64_extension.hpp"
#include "host_api/impl/crypto_extension.hpp"
#include "host_api/impl/json_extension.hpp"

namespace sealbox::runtime {
  class MemoryProvider;
}  // namespace sealbox::runtime

namespace sealbox::host_api {

  /**
   * Dispatches host function calls of one execution to the extensions,
   * counting every call and recording it in the access log
   */
  class HostApiImpl : public HostApi {
   public:
    HostApiImpl() = delete;
    HostApiImpl(std::shared_ptr<const runtime::MemoryProvider> memory_provider,
                std::shared_ptr<const crypto::Hasher> hasher,
                BoundImports bound_imports,
                const HostEnvironment &environment);

    ~HostApiImpl() override = default;

    runtime::WasmI32 hash_commit(runtime::WasmPointer data,
                                 runtime::WasmSize len,
                                 runtime::WasmPointer out_ptr) override;

    runtime::WasmI32 json_path(runtime::WasmPointer data,
                               runtime::WasmSize data_len,
                               runtime::WasmPointer path,
                               runtime::WasmSize path_len,
                               runtime::WasmPointer out_ptr,
                               runtime::WasmSize out_cap) override;

    runtime::WasmI32 base64_encode(runtime::WasmPointer data,
                                   runtime::WasmSize len,
                                   runtime::WasmPointer out_ptr,
                                   runtime::WasmSize out_cap) override;

    runtime::WasmI32 base64_decode(runtime::WasmPointer data,
                                   runtime::WasmSize len,
                                   runtime::WasmPointer out_ptr,
                                   runtime::WasmSize out_cap) override;

    runtime::WasmI64 time_now_ms() override;

    runtime::WasmI32 random_bytes(runtime::WasmPointer out_ptr,
                                  runtime::WasmSize len) override;

    uint32_t hostCalls() const override {
      return host_calls_;
    }

    const AccessLog &accessLog() const override {
      return access_log_;
    }

    void setFailure(std::string reason) override;

    const std::optional<std::string> &failure() const override {
      return failure_;
    }

   private:
    void enter(HostFunctionId id, Capability capability, std::string_view name);

    BoundImports bound_imports_;
    HostEnvironment environment_;

    CryptoExtension crypto_ext_;
    JsonExtension json_ext_;
    Base64Extension base64_ext_;

    uint32_t host_calls_ = 0;
    AccessLog access_log_;
    std::optional<std::string> failure_;
    log::Logger logger_;
  };

}  // namespace sealbox::host_api
