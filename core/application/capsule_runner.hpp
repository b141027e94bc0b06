/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "application/engine_configuration.hpp"
#include "common/buffer.hpp"
#include "common/clock.hpp"
#include "crypto/ed25519_types.hpp"
#include "host_api/access_log.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "receipt/receipt.hpp"
#include "runtime/exec_metrics.hpp"
#include "runtime/resource_limits.hpp"

namespace sealbox::crypto {
  class Hasher;
}  // namespace sealbox::crypto

namespace sealbox::runtime {
  class ModuleValidator;
  class ExecutionEngine;
}  // namespace sealbox::runtime

namespace sealbox::receipt {
  class ReceiptGenerator;
}  // namespace sealbox::receipt

namespace sealbox::application {

  struct RunResult {
    common::Buffer output;
    /// as measured, the receipt carries memory_mb rounded to three decimals
    runtime::ExecMetrics metrics;
    receipt::ExecutionReceipt receipt;
    std::vector<host_api::AccessRecord> access_log;
  };

  /**
   * Details of a failed run
   */
  struct RunFailure {
    std::error_code error;
    runtime::ExecMetrics metrics;
    /// host calls made before the failure, empty if the capsule never ran
    std::vector<host_api::AccessRecord> access_log;
    /// signed when the capsule ran and FailurePolicy asks for it
    std::optional<receipt::ExecutionReceipt> receipt;
  };

  /**
   * Validates, binds, executes and signs one capsule call.
   * Owns the node key and the nonce sequence of that key.
   */
  class CapsuleRunner {
   public:
    static constexpr std::string_view kFailurePrefix = "capsule-failure:";

    CapsuleRunner(std::shared_ptr<const runtime::ModuleValidator> validator,
                  std::shared_ptr<const runtime::ExecutionEngine> engine,
                  std::shared_ptr<const receipt::ReceiptGenerator> generator,
                  std::shared_ptr<const crypto::Hasher> hasher,
                  std::shared_ptr<const common::Clock> clock,
                  crypto::Ed25519Keypair keypair,
                  FailurePolicy failure_policy);

    /**
     * @param failure_out when not null, receives the details of a failure
     * @return output, metrics and receipt, or the error of the first
     * failing stage
     */
    outcome::result<RunResult> run(common::BufferView code,
                                   common::BufferView input,
                                   const runtime::ResourceLimits &limits,
                                   RunFailure *failure_out = nullptr);

    /**
     * Output committed to by failure receipts
     */
    static std::string failureMarker(const std::error_code &error);

    const crypto::Ed25519PublicKey &nodeId() const {
      return keypair_.public_key;
    }

    /// Nonce the next receipt will carry
    uint64_t nextNonce() const {
      return next_nonce_.load();
    }

    FailurePolicy failurePolicy() const {
      return failure_policy_;
    }

   private:
    std::shared_ptr<const runtime::ModuleValidator> validator_;
    std::shared_ptr<const runtime::ExecutionEngine> engine_;
    std::shared_ptr<const receipt::ReceiptGenerator> generator_;
    std::shared_ptr<const crypto::Hasher> hasher_;
    std::shared_ptr<const common::Clock> clock_;
    crypto::Ed25519Keypair keypair_;
    FailurePolicy failure_policy_;
    std::atomic<uint64_t> next_nonce_{1};
    log::Logger logger_;
  };

}  // namespace sealbox::application
