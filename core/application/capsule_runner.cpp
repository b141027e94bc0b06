/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/capsule_runner.hpp"

#include <boost/assert.hpp>
#include <fmt/format.h>

#include "common/time.hpp"
#include "crypto/hasher.hpp"
#include "host_api/capability_sandbox.hpp"
#include "receipt/receipt_generator.hpp"
#include "runtime/capsule_module.hpp"
#include "runtime/execution_engine.hpp"
#include "runtime/module_validator.hpp"

namespace sealbox::application {

  namespace {
    /**
     * Same capsule and input always get the same seed, so reruns by
     * verifiers reproduce the output
     */
    host_api::HostEnvironment makeEnvironment(const common::Hash256 &capsule_id,
                                              common::BufferView input,
                                              const crypto::Hasher &hasher,
                                              common::Clock::TimePoint now) {
      auto input_commit = hasher.sha2_256(input);
      auto seed =
          hasher.sha2_256_concat({capsule_id.view(), input_commit.view()});

      host_api::HostEnvironment environment;
      environment.time_ms = time::toMillis(now);
      std::copy(seed.begin(), seed.end(), environment.random_seed.begin());
      return environment;
    }
  }  // namespace

  CapsuleRunner::CapsuleRunner(
      std::shared_ptr<const runtime::ModuleValidator> validator,
      std::shared_ptr<const runtime::ExecutionEngine> engine,
      std::shared_ptr<const receipt::ReceiptGenerator> generator,
      std::shared_ptr<const crypto::Hasher> hasher,
      std::shared_ptr<const common::Clock> clock,
      crypto::Ed25519Keypair keypair,
      FailurePolicy failure_policy)
      : validator_{std::move(validator)},
        engine_{std::move(engine)},
        generator_{std::move(generator)},
        hasher_{std::move(hasher)},
        clock_{std::move(clock)},
        keypair_{std::move(keypair)},
        failure_policy_{failure_policy},
        logger_{log::createLogger("CapsuleRunner", "application")} {
    BOOST_ASSERT(validator_ != nullptr);
    BOOST_ASSERT(engine_ != nullptr);
    BOOST_ASSERT(generator_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
  }

  std::string CapsuleRunner::failureMarker(const std::error_code &error) {
    return fmt::format("{}{}", kFailurePrefix, error.message());
  }

  outcome::result<RunResult> CapsuleRunner::run(
      common::BufferView code,
      common::BufferView input,
      const runtime::ResourceLimits &limits,
      RunFailure *failure_out) {
    auto fail = [&](const std::error_code &error,
                    const runtime::ExecMetrics &metrics = {},
                    std::vector<host_api::AccessRecord> access_log = {})
        -> outcome::result<RunResult> {
      SL_WARN(logger_,
              "Capsule run failed after {} host calls: {}",
              access_log.size(),
              error.message());
      if (failure_out != nullptr) {
        failure_out->error = error;
        failure_out->metrics = metrics;
        failure_out->access_log = std::move(access_log);
        failure_out->receipt.reset();
      }
      return error;
    };

    auto validation = validator_->validate(code, limits);
    if (not validation) {
      return fail(validation.error());
    }
    for (auto &warning : validation.value().warnings) {
      SL_WARN(logger_, "{}", warning);
    }

    host_api::CapabilitySandbox sandbox{limits.capabilities};
    auto bound = sandbox.bind(validation.value().import_table);
    if (not bound) {
      return fail(bound.error());
    }

    auto module = runtime::CapsuleModule::load(common::toBuffer(code), *hasher_);
    auto now = clock_->now();
    auto environment = makeEnvironment(module.id, input, *hasher_, now);

    runtime::ExecMetrics metrics;
    std::vector<host_api::AccessRecord> access_log;
    auto execution = engine_->execute(module,
                                      bound.value(),
                                      input,
                                      limits,
                                      environment,
                                      &metrics,
                                      &access_log);
    if (not execution) {
      auto error = execution.error();
      auto res = fail(error, metrics, std::move(access_log));
      if (failure_policy_ == FailurePolicy::SIGNED_FAILURE_RECEIPT
          and failure_out != nullptr) {
        auto marker = failureMarker(error);
        common::Buffer marker_bytes{marker.begin(), marker.end()};
        auto nonce = next_nonce_.fetch_add(1);
        auto failure_receipt = generator_->makeReceipt(
            module, input, marker_bytes, metrics, keypair_, nonce, now);
        if (failure_receipt) {
          failure_out->receipt = std::move(failure_receipt.value());
        } else {
          SL_ERROR(logger_,
                   "Failure receipt not signed: {}",
                   failure_receipt.error().message());
        }
      }
      return res;
    }

    auto &[output, exec_metrics, calls] = execution.value();
    auto nonce = next_nonce_.fetch_add(1);
    OUTCOME_TRY(signed_receipt,
                generator_->makeReceipt(
                    module, input, output, exec_metrics, keypair_, nonce, now));
    SL_INFO(logger_,
            "Capsule {} returned {} bytes after {} host calls, nonce {}",
            module.id,
            output.size(),
            calls.size(),
            nonce);
    return RunResult{
        .output = std::move(output),
        .metrics = exec_metrics,
        .receipt = std::move(signed_receipt),
        .access_log = std::move(calls),
    };
  }

}  // namespace sealbox::application
