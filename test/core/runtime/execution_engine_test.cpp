/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/common/execution_engine_impl.hpp"

#include <chrono>
#include <limits>

#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "host_api/impl/host_api_factory_impl.hpp"
#include "runtime/execution_error.hpp"
#include "runtime/module_cache.hpp"
#include "runtime/validation_error.hpp"
#include "runtime/wasm_edge/module_factory_impl.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/runtime/capsules.hpp"
#include "testutil/runtime/wat.hpp"

using namespace sealbox::runtime;
using sealbox::common::Buffer;
using sealbox::common::BufferView;
using sealbox::crypto::HasherImpl;
using sealbox::host_api::AccessRecord;
using sealbox::host_api::BoundImports;
using sealbox::host_api::Capability;
using sealbox::host_api::CapabilitySandbox;
using sealbox::host_api::CapabilitySet;
using sealbox::host_api::HostApiFactoryImpl;
using sealbox::host_api::HostEnvironment;
namespace capsules = testutil::capsules;

namespace {
  Buffer bytesOf(std::string_view s) {
    return Buffer{s.begin(), s.end()};
  }

  /// Counts parses to observe the module cache
  class CountingModuleFactory : public ModuleFactory {
   public:
    outcome::result<std::shared_ptr<const Module>> make(
        BufferView code, const sealbox::common::Hash256 &digest) const override {
      ++calls;
      return factory.make(code, digest);
    }

    mutable size_t calls = 0;
    wasm_edge::ModuleFactoryImpl factory;
  };
}  // namespace

class ExecutionEngineTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  void SetUp() override {
    engine = makeEngine(kDefaultMaxIoSize);
  }

  std::unique_ptr<ExecutionEngineImpl> makeEngine(size_t max_io_size) {
    return std::make_unique<ExecutionEngineImpl>(
        module_factory,
        module_cache,
        std::make_shared<HostApiFactoryImpl>(hasher),
        max_io_size);
  }

  CapsuleModule load(std::string_view wat) {
    return CapsuleModule::load(testutil::watToWasm(wat), *hasher);
  }

  BoundImports bind(const CapsuleModule &capsule) {
    auto module =
        module_factory->factory.make(capsule.code, capsule.id).value();
    return CapabilitySandbox{limits.capabilities}
        .bind(module->imports())
        .value();
  }

  outcome::result<Execution> execute(std::string_view wat,
                                     BufferView input,
                                     ExecMetrics *metrics = nullptr) {
    auto capsule = load(wat);
    return engine->execute(
        capsule, bind(capsule), input, limits, environment, metrics);
  }

  std::shared_ptr<HasherImpl> hasher = std::make_shared<HasherImpl>();
  std::shared_ptr<CountingModuleFactory> module_factory =
      std::make_shared<CountingModuleFactory>();
  std::shared_ptr<ModuleCache> module_cache = std::make_shared<ModuleCache>(4);
  std::unique_ptr<ExecutionEngineImpl> engine;
  ResourceLimits limits = ResourceLimits::defaults();
  HostEnvironment environment{.time_ms = 1'700'000'000'000,
                              .random_seed = {}};
};

/**
 * @given capsule writing "Hello " followed by a copy of its input
 * @when executed with a 16 byte JSON input
 * @then the 22 byte greeting is returned with metrics of the run
 */
TEST_F(ExecutionEngineTest, HelloCapsule) {
  auto input = bytesOf(R"({"name":"Alice"})");
  ASSERT_EQ(input.size(), 16);
  EXPECT_OUTCOME_TRUE(execution, execute(capsules::kHello, input));
  EXPECT_EQ(execution.output, bytesOf(R"(Hello {"name":"Alice"})"));
  EXPECT_EQ(execution.output.size(), 22);
  EXPECT_GT(execution.metrics.fuel_used, 0);
  EXPECT_LE(execution.metrics.fuel_used, limits.fuel_limit);
  EXPECT_DOUBLE_EQ(execution.metrics.memory_mb, 0.0625);
  EXPECT_EQ(execution.metrics.host_calls, 0);
}

TEST_F(ExecutionEngineTest, EmptyInput) {
  EXPECT_OUTCOME_TRUE(execution, execute(capsules::kHello, Buffer{}));
  EXPECT_EQ(execution.output, bytesOf("Hello "));
}

/**
 * @given capsule reading random bytes and time from the host
 * @when it is executed twice with the same input and environment
 * @then output, metrics other than wall-clock time, and host calls are
 * identical
 */
TEST_F(ExecutionEngineTest, Deterministic) {
  limits = limits.withCapability(Capability::Random)
               .withCapability(Capability::Time);
  auto input = bytesOf("deterministic");
  EXPECT_OUTCOME_TRUE(first, execute(capsules::kRandomAndTime, input));
  EXPECT_OUTCOME_TRUE(second, execute(capsules::kRandomAndTime, input));
  ASSERT_EQ(first.output.size(), 24);
  EXPECT_EQ(first.output, second.output);
  EXPECT_EQ(first.metrics.fuel_used, second.metrics.fuel_used);
  EXPECT_EQ(first.metrics.memory_mb, second.metrics.memory_mb);
  EXPECT_EQ(first.metrics.host_calls, 2);
  EXPECT_EQ(first.metrics.host_calls, second.metrics.host_calls);
  EXPECT_EQ(first.access_log, second.access_log);

  environment.random_seed[0] ^= 1;
  EXPECT_OUTCOME_TRUE(reseeded, execute(capsules::kRandomAndTime, input));
  EXPECT_NE(Buffer(first.output.begin(), first.output.begin() + 16),
            Buffer(reseeded.output.begin(), reseeded.output.begin() + 16));
  EXPECT_EQ(Buffer(first.output.begin() + 16, first.output.end()),
            Buffer(reseeded.output.begin() + 16, reseeded.output.end()));
}

/**
 * @given capsules calling host functions
 * @when they finish or fail
 * @then every call is recorded in order with its capability
 */
TEST_F(ExecutionEngineTest, HostCallsAreRecorded) {
  limits = limits.withCapability(Capability::Random)
               .withCapability(Capability::Time);
  EXPECT_OUTCOME_TRUE(execution, execute(capsules::kRandomAndTime, Buffer{}));
  EXPECT_EQ(execution.access_log,
            (std::vector<AccessRecord>{
                {Capability::Random, "random_bytes", 0},
                {Capability::Time, "time_now_ms", 1},
            }));

  std::vector<AccessRecord> access_log;
  auto capsule = load(capsules::kHashOutOfBounds);
  EXPECT_EC(engine->execute(capsule,
                            bind(capsule),
                            bytesOf("abc"),
                            limits,
                            environment,
                            nullptr,
                            &access_log),
            ExecutionError::HOST_FUNCTION_FAILURE);
  EXPECT_EQ(access_log,
            (std::vector<AccessRecord>{{Capability::Hash, "hash_commit", 0}}));
}

/**
 * @given capsule that never returns and a fuel budget too large to exhaust
 * @when executed with a short time limit
 * @then TIMEOUT is returned
 */
TEST_F(ExecutionEngineTest, Timeout) {
  limits.execution_time_ms = 50;
  limits.fuel_limit = std::numeric_limits<uint64_t>::max();
  ExecMetrics metrics;
  EXPECT_EC(execute(capsules::kInfiniteLoop, Buffer{}, &metrics),
            ExecutionError::TIMEOUT);
  EXPECT_GE(metrics.duration_ms, 50);
}

/**
 * @given capsule that never returns
 * @when executed with a small fuel budget
 * @then RESOURCE_EXCEEDED_FUEL is returned and the whole budget is reported
 */
TEST_F(ExecutionEngineTest, FuelExhausted) {
  limits.fuel_limit = 10'000;
  limits.execution_time_ms = 10'000;
  ExecMetrics metrics;
  EXPECT_EC(execute(capsules::kInfiniteLoop, Buffer{}, &metrics),
            ExecutionError::RESOURCE_EXCEEDED_FUEL);
  EXPECT_EQ(metrics.fuel_used, limits.fuel_limit);
}

/**
 * @given capsule whose start function never returns, unlimited fuel and a
 * short time limit
 * @when executed
 * @then it is refused before any guest code runs
 */
TEST_F(ExecutionEngineTest, StartFunctionIsRefused) {
  limits.execution_time_ms = 50;
  limits.fuel_limit = std::numeric_limits<uint64_t>::max();
  ExecMetrics metrics;
  auto started = std::chrono::steady_clock::now();
  EXPECT_EC(execute(capsules::kSpinningStart, Buffer{}, &metrics),
            ValidationError::START_FUNCTION);
  EXPECT_LT(std::chrono::steady_clock::now() - started,
            std::chrono::seconds{5});
  EXPECT_EQ(metrics.fuel_used, 0);
}

/**
 * @given capsule growing memory until it fails
 * @when executed with a 1 MiB ceiling
 * @then RESOURCE_EXCEEDED_MEMORY is returned at 16 pages
 */
TEST_F(ExecutionEngineTest, MemoryCeiling) {
  limits.memory_limit_mb = 1;
  ExecMetrics metrics;
  EXPECT_EC(execute(capsules::kMemoryHog, Buffer{}, &metrics),
            ExecutionError::RESOURCE_EXCEEDED_MEMORY);
  EXPECT_DOUBLE_EQ(metrics.memory_mb, 1.0);
}

TEST_F(ExecutionEngineTest, InitialMemoryOverCeiling) {
  limits.memory_limit_mb = 1;
  EXPECT_EC(execute(capsules::kLargeInitialMemory, Buffer{}),
            ExecutionError::RESOURCE_EXCEEDED_MEMORY);
  limits.memory_limit_mb = 4;
  EXPECT_OUTCOME_TRUE_1(execute(capsules::kLargeInitialMemory, Buffer{}));
}

TEST_F(ExecutionEngineTest, Trap) {
  EXPECT_EC(execute(capsules::kUnreachable, Buffer{}), ExecutionError::TRAP);
}

TEST_F(ExecutionEngineTest, OutputOutOfBoundsTraps) {
  EXPECT_EC(execute(capsules::kOutOfBoundsOutput, Buffer{}),
            ExecutionError::TRAP);
}

/**
 * @given engine bounding input and output to 16 bytes
 * @when input or output exceed it
 * @then IO_LIMIT is returned
 */
TEST_F(ExecutionEngineTest, IoLimit) {
  engine = makeEngine(16);
  EXPECT_EC(execute(capsules::kEcho, Buffer(17, 'x')), ExecutionError::IO_LIMIT);
  EXPECT_EC(execute(capsules::kHello, Buffer(16, 'x')),
            ExecutionError::IO_LIMIT);
  EXPECT_OUTCOME_TRUE_1(execute(capsules::kHello, Buffer(10, 'x')));
}

TEST_F(ExecutionEngineTest, HostFunctionFailure) {
  ExecMetrics metrics;
  EXPECT_EC(execute(capsules::kHashOutOfBounds, bytesOf("abc"), &metrics),
            ExecutionError::HOST_FUNCTION_FAILURE);
  EXPECT_EQ(metrics.host_calls, 1);
}

TEST_F(ExecutionEngineTest, HashCommitFromGuest) {
  auto input = bytesOf("abc");
  EXPECT_OUTCOME_TRUE(execution, execute(capsules::kHashInput, input));
  auto expected = hasher->sha2_256(input);
  EXPECT_EQ(execution.output, Buffer(expected.begin(), expected.end()));
  EXPECT_EQ(execution.metrics.host_calls, 1);
}

/**
 * @given capsule reading time twice
 * @when executed with an injected time
 * @then both reads return it and two host calls are counted
 */
TEST_F(ExecutionEngineTest, InjectedTimeAndHostCalls) {
  limits = limits.withCapability(Capability::Time);
  EXPECT_OUTCOME_TRUE(execution, execute(capsules::kTwoTimestamps, Buffer{}));
  ASSERT_EQ(execution.output.size(), 16);
  uint64_t first = 0;
  uint64_t second = 0;
  for (size_t i = 0; i < 8; ++i) {
    first |= static_cast<uint64_t>(execution.output[i]) << (8 * i);
    second |= static_cast<uint64_t>(execution.output[8 + i]) << (8 * i);
  }
  EXPECT_EQ(first, environment.time_ms);
  EXPECT_EQ(second, environment.time_ms);
  EXPECT_EQ(execution.metrics.host_calls, 2);
}

/**
 * @given capsule returning random bytes
 * @when executed twice with the same seed and once with another
 * @then same seed gives the same bytes
 */
TEST_F(ExecutionEngineTest, SeededRandomness) {
  limits = limits.withCapability(Capability::Random);
  EXPECT_OUTCOME_TRUE(first, execute(capsules::kRandom, Buffer{}));
  EXPECT_OUTCOME_TRUE(second, execute(capsules::kRandom, Buffer{}));
  EXPECT_EQ(first.output, second.output);

  environment.random_seed[5] = 0x55;
  EXPECT_OUTCOME_TRUE(third, execute(capsules::kRandom, Buffer{}));
  EXPECT_NE(first.output, third.output);
}

/**
 * @given the same capsule executed several times
 * @when the module cache is enabled
 * @then the code is parsed once
 */
TEST_F(ExecutionEngineTest, ModuleCacheAvoidsReparsing) {
  auto capsule = load(capsules::kEcho);
  auto bound = bind(capsule);
  for (int i = 0; i < 3; ++i) {
    EXPECT_OUTCOME_TRUE_1(engine->execute(
        capsule, bound, bytesOf("x"), limits, environment, nullptr));
  }
  EXPECT_EQ(module_factory->calls, 1);
  EXPECT_EQ(module_cache->size(), 1);
}
