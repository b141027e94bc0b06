/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/common/module_validator_impl.hpp"

#include <gmock/gmock.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "runtime/wasm_edge/module_factory_impl.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/runtime/capsules.hpp"
#include "testutil/runtime/wat.hpp"

using namespace sealbox::runtime;
using sealbox::common::Buffer;
using sealbox::crypto::HasherImpl;
using sealbox::host_api::Capability;
using sealbox::host_api::CapabilitySet;
using testutil::watToWasm;
namespace capsules = testutil::capsules;

class ModuleValidatorTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  outcome::result<ValidationResult> validate(std::string_view wat) {
    return validator.validate(watToWasm(wat), limits);
  }

  static std::string dataModule(size_t data_size) {
    return fmt::format(R"(
(module
  (memory (export "memory") 1)
  (data (i32.const 0) "{}")
  (func (export "run") (param i32 i32) (result i32)
    (i32.const 0)))
)",
                       std::string(data_size, 'x'));
  }

  ResourceLimits limits = ResourceLimits::defaults();
  ModuleValidatorImpl validator{
      std::make_shared<wasm_edge::ModuleFactoryImpl>(),
      std::make_shared<HasherImpl>()};
};

/**
 * @given module exporting run and memory, importing nothing
 * @when validated with default limits
 * @then it is accepted and its interface is reported
 */
TEST_F(ModuleValidatorTest, AcceptsMinimalCapsule) {
  auto code = watToWasm(capsules::kHello);
  EXPECT_OUTCOME_TRUE(result, validator.validate(code, limits));
  EXPECT_EQ(result.size_bytes, code.size());
  EXPECT_THAT(result.exports, testing::UnorderedElementsAre("memory", "run"));
  EXPECT_TRUE(result.imports.empty());
  EXPECT_TRUE(result.import_table.empty());
  EXPECT_TRUE(result.warnings.empty());
}

TEST_F(ModuleValidatorTest, ReportsImports) {
  EXPECT_OUTCOME_TRUE(result, validate(capsules::kHashInput));
  EXPECT_EQ(result.imports, std::vector<std::string>{"env::hash_commit"});
  ASSERT_EQ(result.import_table.size(), 1);
  EXPECT_EQ(result.import_table[0].name, "hash_commit");
  EXPECT_TRUE(result.import_table[0].signature);
}

/**
 * @given code one byte over the size limit
 * @when validated
 * @then TOO_LARGE is returned before the bytes are parsed
 */
TEST_F(ModuleValidatorTest, TooLarge) {
  limits.max_module_size_kb = 1;
  Buffer garbage(1025, 0xAB);
  EXPECT_EC(validator.validate(garbage, limits), ValidationError::TOO_LARGE);
  EXPECT_EC(validate(dataModule(1100)), ValidationError::TOO_LARGE);
}

TEST_F(ModuleValidatorTest, SizeWarning) {
  limits.max_module_size_kb = 1;
  EXPECT_OUTCOME_TRUE(result, validate(dataModule(900)));
  ASSERT_EQ(result.warnings.size(), 1);
  EXPECT_NE(result.warnings[0].find("approaching"), std::string::npos);
}

TEST_F(ModuleValidatorTest, Malformed) {
  Buffer not_wasm{'n', 'o', 't', ' ', 'w', 'a', 's', 'm'};
  EXPECT_EC(validator.validate(not_wasm, limits), ValidationError::MALFORMED);
  EXPECT_EC(validator.validate(Buffer{}, limits), ValidationError::MALFORMED);

  // valid header followed by a truncated section
  auto code = watToWasm(capsules::kHello);
  code.resize(code.size() - 3);
  EXPECT_EC(validator.validate(code, limits), ValidationError::MALFORMED);
}

/**
 * @given modules missing run, with a wrong run signature, or without an
 * exported memory
 * @when validated
 * @then MISSING_EXPORT is returned
 */
TEST_F(ModuleValidatorTest, MissingExport) {
  EXPECT_EC(validate(capsules::kNoRun), ValidationError::MISSING_EXPORT);
  EXPECT_EC(validate(capsules::kWrongRunSignature),
            ValidationError::MISSING_EXPORT);
  EXPECT_EC(validate(capsules::kNoMemory), ValidationError::MISSING_EXPORT);
}

/**
 * @given module with a start function
 * @when validated
 * @then START_FUNCTION is returned
 */
TEST_F(ModuleValidatorTest, StartFunction) {
  EXPECT_EC(validate(capsules::kSpinningStart),
            ValidationError::START_FUNCTION);
}

/**
 * @given module importing a host function of a capability not granted
 * @when validated
 * @then UNAUTHORIZED_IMPORT is returned, granting the capability accepts it
 */
TEST_F(ModuleValidatorTest, UnauthorizedImport) {
  limits.capabilities = CapabilitySet{Capability::Json};
  EXPECT_EC(validate(capsules::kHashInput),
            ValidationError::UNAUTHORIZED_IMPORT);
  limits = limits.withCapability(Capability::Hash);
  EXPECT_OUTCOME_TRUE_1(validate(capsules::kHashInput));

  limits.capabilities = CapabilitySet::all();
  EXPECT_EC(validate(capsules::kWasiImport),
            ValidationError::UNAUTHORIZED_IMPORT);
}
