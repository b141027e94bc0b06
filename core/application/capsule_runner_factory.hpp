/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "application/capsule_runner.hpp"
#include "application/engine_configuration.hpp"
#include "common/clock.hpp"
#include "crypto/ed25519_types.hpp"
#include "outcome/outcome.hpp"

namespace sealbox::application {

  /**
   * Wires a runner over WasmEdge as \param config describes: module cache
   * capacity, I/O bound and failure policy. Applies the `log` entries of
   * the configuration to the logging system first, so it must be set.
   * @param keypair node key signing the receipts
   */
  outcome::result<std::unique_ptr<CapsuleRunner>> makeCapsuleRunner(
      const EngineConfiguration &config,
      crypto::Ed25519Keypair keypair,
      std::shared_ptr<const common::Clock> clock);

}  // namespace sealbox::application
