/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/capsule_runner.hpp"

#include <algorithm>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "host_api/impl/host_api_factory_impl.hpp"
#include "host_api/security_error.hpp"
#include "mock/common/clock_mock.hpp"
#include "receipt/receipt_generator.hpp"
#include "receipt/receipt_verifier.hpp"
#include "receipt/signing_payload.hpp"
#include "runtime/common/execution_engine_impl.hpp"
#include "runtime/common/module_validator_impl.hpp"
#include "runtime/execution_error.hpp"
#include "runtime/module_cache.hpp"
#include "runtime/validation_error.hpp"
#include "runtime/wasm_edge/module_factory_impl.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/runtime/capsules.hpp"
#include "testutil/runtime/wat.hpp"

using namespace sealbox::application;
using sealbox::common::Buffer;
using sealbox::common::ClockMock;
using sealbox::crypto::Ed25519ProviderImpl;
using sealbox::crypto::HasherImpl;
using sealbox::host_api::Capability;
using sealbox::receipt::ReceiptGenerator;
using sealbox::receipt::ReceiptVerifier;
using sealbox::host_api::AccessRecord;
using sealbox::runtime::CapsuleModule;
using sealbox::runtime::ExecMetrics;
using sealbox::runtime::ExecutionEngineImpl;
using sealbox::runtime::ExecutionError;
using sealbox::runtime::ModuleCache;
using sealbox::runtime::ModuleValidatorImpl;
using sealbox::runtime::ResourceLimits;
using sealbox::runtime::ValidationError;
using sealbox::runtime::wasm_edge::ModuleFactoryImpl;
using testing::Return;
using testutil::watToWasm;
namespace capsules = testutil::capsules;

namespace {
  Buffer bytesOf(std::string_view s) {
    return Buffer{s.begin(), s.end()};
  }

  ExecMetrics signedForm(ExecMetrics metrics) {
    metrics.memory_mb = sealbox::receipt::canonicalMemoryMb(metrics.memory_mb);
    return metrics;
  }
}  // namespace

class CapsuleRunnerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  void SetUp() override {
    ON_CALL(*clock, now()).WillByDefault(Return(now));
    runner = makeRunner(FailurePolicy::NO_RECEIPT);
  }

  std::unique_ptr<CapsuleRunner> makeRunner(FailurePolicy policy) {
    auto module_factory = std::make_shared<ModuleFactoryImpl>();
    return std::make_unique<CapsuleRunner>(
        std::make_shared<ModuleValidatorImpl>(module_factory, hasher),
        std::make_shared<ExecutionEngineImpl>(
            module_factory,
            std::make_shared<ModuleCache>(),
            std::make_shared<sealbox::host_api::HostApiFactoryImpl>(hasher),
            sealbox::runtime::kDefaultMaxIoSize),
        std::make_shared<ReceiptGenerator>(hasher, ed25519),
        hasher,
        clock,
        ed25519->generateRandomKeypair().value(),
        policy);
  }

  std::shared_ptr<HasherImpl> hasher = std::make_shared<HasherImpl>();
  std::shared_ptr<Ed25519ProviderImpl> ed25519 =
      std::make_shared<Ed25519ProviderImpl>();
  sealbox::common::Clock::TimePoint now{
      std::chrono::milliseconds{1'700'000'000'000}};
  std::shared_ptr<testing::NiceMock<ClockMock>> clock =
      std::make_shared<testing::NiceMock<ClockMock>>();
  ReceiptVerifier verifier{hasher, ed25519, clock};
  std::unique_ptr<CapsuleRunner> runner;
  ResourceLimits limits = ResourceLimits::defaults();
};

/**
 * @given the hello capsule and a JSON input
 * @when it is run end to end
 * @then output, commitments and signature of the receipt all check out
 */
TEST_F(CapsuleRunnerTest, HelloEndToEnd) {
  auto code = watToWasm(capsules::kHello);
  auto input = bytesOf(R"({"name":"Alice"})");

  EXPECT_OUTCOME_TRUE(result, runner->run(code, input, limits));
  auto expected_output = bytesOf(R"(Hello {"name":"Alice"})");
  EXPECT_EQ(result.output, expected_output);
  EXPECT_EQ(result.receipt.exec_metrics, signedForm(result.metrics));
  EXPECT_EQ(result.receipt.input_commit, hasher->sha2_256(input));
  EXPECT_EQ(result.receipt.output_commit, hasher->sha2_256(expected_output));
  EXPECT_EQ(result.receipt.node_id, runner->nodeId());
  EXPECT_EQ(result.receipt.timestamp, "2023-11-14T22:13:20.000Z");

  EXPECT_TRUE(verifier.verify(result.receipt, runner->nodeId()));
  EXPECT_TRUE(verifier.verifyCommitments(result.receipt,
                                         CapsuleModule::load(code, *hasher),
                                         input,
                                         expected_output));
  EXPECT_OUTCOME_TRUE_1(verifier.verifyReceipt(result.receipt));
}

/**
 * @given several runs, some of them failing
 * @when nonces of issued receipts are compared
 * @then they grow by one per receipt and failures consume none
 */
TEST_F(CapsuleRunnerTest, NoncesAreMonotonic) {
  auto code = watToWasm(capsules::kEcho);
  EXPECT_EQ(runner->nextNonce(), 1);
  EXPECT_OUTCOME_TRUE(first, runner->run(code, bytesOf("a"), limits));
  EXPECT_EC(runner->run(watToWasm(capsules::kUnreachable), Buffer{}, limits),
            ExecutionError::TRAP);
  EXPECT_OUTCOME_TRUE(second, runner->run(code, bytesOf("a"), limits));
  EXPECT_EQ(first.receipt.nonce, 1);
  EXPECT_EQ(second.receipt.nonce, 2);
  EXPECT_NE(first.receipt.signature, second.receipt.signature);
  EXPECT_EQ(runner->nextNonce(), 3);
}

TEST_F(CapsuleRunnerTest, ConcurrentRunsGetDistinctNonces) {
  auto code = watToWasm(capsules::kEcho);
  std::vector<uint64_t> nonces(8);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < nonces.size(); ++i) {
    threads.emplace_back([&, i] {
      auto res = runner->run(code, bytesOf("x"), limits);
      nonces[i] = res ? res.value().receipt.nonce : 0;
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  std::sort(nonces.begin(), nonces.end());
  for (size_t i = 0; i < nonces.size(); ++i) {
    EXPECT_EQ(nonces[i], i + 1);
  }
}

/**
 * @given the same capsule and input run twice
 * @when the capsule draws random bytes
 * @then both outputs match since the seed derives from capsule and input
 */
TEST_F(CapsuleRunnerTest, ReproducibleRandomness) {
  limits = limits.withCapability(Capability::Random);
  auto code = watToWasm(capsules::kRandom);
  EXPECT_OUTCOME_TRUE(a, runner->run(code, bytesOf("in"), limits));
  EXPECT_OUTCOME_TRUE(b, runner->run(code, bytesOf("in"), limits));
  EXPECT_OUTCOME_TRUE(c, runner->run(code, bytesOf("other"), limits));
  EXPECT_EQ(a.output, b.output);
  EXPECT_NE(a.output, c.output);
}

/**
 * @given capsules calling host functions
 * @when they are run to success or to failure
 * @then the host calls made are returned with the result or the failure
 */
TEST_F(CapsuleRunnerTest, ReportsHostCalls) {
  limits = limits.withCapability(Capability::Random)
               .withCapability(Capability::Time);
  EXPECT_OUTCOME_TRUE(
      result,
      runner->run(watToWasm(capsules::kRandomAndTime), Buffer{}, limits));
  EXPECT_EQ(result.access_log,
            (std::vector<AccessRecord>{
                {Capability::Random, "random_bytes", 0},
                {Capability::Time, "time_now_ms", 1},
            }));
  EXPECT_EQ(result.metrics.host_calls, result.access_log.size());

  RunFailure failure;
  EXPECT_EC(runner->run(watToWasm(capsules::kHashOutOfBounds),
                        bytesOf("abc"),
                        limits,
                        &failure),
            ExecutionError::HOST_FUNCTION_FAILURE);
  EXPECT_EQ(failure.access_log,
            (std::vector<AccessRecord>{{Capability::Hash, "hash_commit", 0}}));

  EXPECT_EC(runner->run(bytesOf("garbage"), Buffer{}, limits, &failure),
            ValidationError::MALFORMED);
  EXPECT_TRUE(failure.access_log.empty());
}

TEST_F(CapsuleRunnerTest, ValidationFailures) {
  RunFailure failure;
  EXPECT_EC(runner->run(bytesOf("garbage"), Buffer{}, limits, &failure),
            ValidationError::MALFORMED);
  EXPECT_EQ(failure.error, ValidationError::MALFORMED);
  EXPECT_FALSE(failure.receipt);

  EXPECT_EC(
      runner->run(watToWasm(capsules::kSpinningStart), Buffer{}, limits),
      ValidationError::START_FUNCTION);

  limits = limits.withoutCapability(Capability::Hash);
  EXPECT_EC(runner->run(watToWasm(capsules::kHashInput), Buffer{}, limits),
            ValidationError::UNAUTHORIZED_IMPORT);
  EXPECT_EQ(runner->nextNonce(), 1);
}

/**
 * @given runner signing failure receipts
 * @when an execution runs out of fuel
 * @then the error is returned and a receipt commits to the failure marker
 */
TEST_F(CapsuleRunnerTest, SignedFailureReceipt) {
  runner = makeRunner(FailurePolicy::SIGNED_FAILURE_RECEIPT);
  limits.fuel_limit = 5'000;
  RunFailure failure;
  auto code = watToWasm(capsules::kInfiniteLoop);
  EXPECT_EC(runner->run(code, bytesOf("in"), limits, &failure),
            ExecutionError::RESOURCE_EXCEEDED_FUEL);
  EXPECT_EQ(failure.error, ExecutionError::RESOURCE_EXCEEDED_FUEL);
  EXPECT_EQ(failure.metrics.fuel_used, 5'000);
  ASSERT_TRUE(failure.receipt);

  auto marker = CapsuleRunner::failureMarker(failure.error);
  EXPECT_TRUE(marker.starts_with(CapsuleRunner::kFailurePrefix));
  EXPECT_TRUE(verifier.verifyNodeSignature(*failure.receipt));
  EXPECT_TRUE(verifier.verifyCommitments(*failure.receipt,
                                         CapsuleModule::load(code, *hasher),
                                         bytesOf("in"),
                                         bytesOf(marker)));
  EXPECT_EQ(failure.receipt->exec_metrics, signedForm(failure.metrics));
  EXPECT_EQ(runner->nextNonce(), 2);
}

TEST_F(CapsuleRunnerTest, NoReceiptPolicy) {
  limits.fuel_limit = 5'000;
  RunFailure failure;
  EXPECT_EC(runner->run(watToWasm(capsules::kInfiniteLoop),
                        Buffer{},
                        limits,
                        &failure),
            ExecutionError::RESOURCE_EXCEEDED_FUEL);
  EXPECT_FALSE(failure.receipt);
  EXPECT_EQ(runner->failurePolicy(), FailurePolicy::NO_RECEIPT);
  EXPECT_EQ(runner->nextNonce(), 1);
}
