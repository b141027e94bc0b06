/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/capsule_runner_factory.hpp"

#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "host_api/impl/host_api_factory_impl.hpp"
#include "log/logger.hpp"
#include "receipt/receipt_generator.hpp"
#include "runtime/common/execution_engine_impl.hpp"
#include "runtime/common/module_validator_impl.hpp"
#include "runtime/module_cache.hpp"
#include "runtime/wasm_edge/module_factory_impl.hpp"

namespace sealbox::application {

  outcome::result<std::unique_ptr<CapsuleRunner>> makeCapsuleRunner(
      const EngineConfiguration &config,
      crypto::Ed25519Keypair keypair,
      std::shared_ptr<const common::Clock> clock) {
    OUTCOME_TRY(log::tuneLoggingSystem(config.log()));

    auto hasher = std::make_shared<crypto::HasherImpl>();
    auto ed25519 = std::make_shared<crypto::Ed25519ProviderImpl>();
    // validator and engine parse with the same WasmEdge configuration
    auto module_factory =
        std::make_shared<runtime::wasm_edge::ModuleFactoryImpl>();

    auto engine = std::make_shared<runtime::ExecutionEngineImpl>(
        module_factory,
        std::make_shared<runtime::ModuleCache>(config.moduleCacheSize()),
        std::make_shared<host_api::HostApiFactoryImpl>(hasher),
        config.maxIoSize());

    auto logger = log::createLogger("CapsuleRunnerFactory", "application");
    SL_DEBUG(logger,
             "Runner for node {}: module cache {}, I/O bound {} bytes",
             keypair.public_key,
             config.moduleCacheSize(),
             config.maxIoSize());

    return std::make_unique<CapsuleRunner>(
        std::make_shared<runtime::ModuleValidatorImpl>(module_factory, hasher),
        std::move(engine),
        std::make_shared<receipt::ReceiptGenerator>(hasher, ed25519),
        hasher,
        std::move(clock),
        std::move(keypair),
        config.failurePolicy());
  }

}  // namespace sealbox::application
