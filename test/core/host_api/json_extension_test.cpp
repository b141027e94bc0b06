/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/json_extension.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/runtime/memory.hpp"

using namespace sealbox::host_api;
using sealbox::common::asString;
using testutil::TestMemoryProvider;

namespace {
  constexpr std::string_view kDocument =
      R"({"user":{"name":"Alice","tags":["a","b"]},"n":7,"a/b":true})";

  std::optional<std::string> resolve(std::string_view path) {
    auto res = resolveJsonPath(kDocument, path);
    EXPECT_TRUE(res) << res.error().message();
    return res.value();
  }
}  // namespace

TEST(ResolveJsonPathTest, DottedKeys) {
  EXPECT_EQ(resolve("user.name"), R"("Alice")");
  EXPECT_EQ(resolve("user.tags.1"), R"("b")");
  EXPECT_EQ(resolve("n"), "7");
  EXPECT_EQ(resolve("user"), R"({"name":"Alice","tags":["a","b"]})");
  EXPECT_EQ(resolve("user.missing"), std::nullopt);
  EXPECT_EQ(resolve("user.tags.2"), std::nullopt);
  EXPECT_EQ(resolve("user.tags.x"), std::nullopt);
  EXPECT_EQ(resolve("n.deeper"), std::nullopt);
}

TEST(ResolveJsonPathTest, JsonPointer) {
  EXPECT_EQ(resolve("/user/tags/0"), R"("a")");
  EXPECT_EQ(resolve("/a~1b"), "true");
  EXPECT_EQ(resolve("/nothing"), std::nullopt);
}

TEST(ResolveJsonPathTest, EmptyPathSelectsDocument) {
  auto res = resolveJsonPath(R"( [1, 2] )", "");
  EXPECT_OUTCOME_TRUE(value, res);
  EXPECT_EQ(value, "[1,2]");
}

TEST(ResolveJsonPathTest, Errors) {
  EXPECT_EC(resolveJsonPath(R"({"a":)", "a"), JsonPathError::MALFORMED_DOCUMENT);
  EXPECT_EC(resolveJsonPath(kDocument, "/user/~2"),
            JsonPathError::MALFORMED_PATH);
}

/**
 * @given documents nested up to and beyond the depth limit
 * @when they are resolved
 * @then the deepest allowed one resolves and a million levels are rejected
 * without being built
 */
TEST(ResolveJsonPathTest, NestingDepthIsBounded) {
  auto nested = [](size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
  };
  auto deepest = nested(kMaxJsonDepth);
  EXPECT_OUTCOME_TRUE(value, resolveJsonPath(deepest, ""));
  EXPECT_EQ(value, deepest);

  EXPECT_EC(resolveJsonPath(nested(kMaxJsonDepth + 1), ""),
            JsonPathError::DOCUMENT_TOO_DEEP);
  EXPECT_EC(resolveJsonPath(std::string(1'000'000, '['), ""),
            JsonPathError::DOCUMENT_TOO_DEEP);
  EXPECT_EC(resolveJsonPath(std::string(1'000'000, '{'), ""),
            JsonPathError::DOCUMENT_TOO_DEEP);
}

class JsonExtensionTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  void SetUp() override {
    memory_provider = std::make_shared<TestMemoryProvider>();
    json_ext = std::make_unique<JsonExtension>(memory_provider);
    ASSERT_TRUE(memory().storeBuffer(
        kData, sealbox::common::BufferView{
                   reinterpret_cast<const uint8_t *>(kDocument.data()),
                   kDocument.size()}));
  }

  testutil::TestMemory &memory() {
    return memory_provider->memory();
  }

  void writePath(std::string_view path) {
    ASSERT_TRUE(memory().storeBuffer(
        kPath,
        sealbox::common::BufferView{
            reinterpret_cast<const uint8_t *>(path.data()), path.size()}));
  }

  static constexpr uint32_t kData = 0;
  static constexpr uint32_t kPath = 1000;
  static constexpr uint32_t kOut = 2000;

  std::shared_ptr<TestMemoryProvider> memory_provider;
  std::unique_ptr<JsonExtension> json_ext;
};

/**
 * @given JSON document and path in guest memory
 * @when json_path is called
 * @then the value is written to the output and its length returned
 */
TEST_F(JsonExtensionTest, WritesValue) {
  writePath("user.name");
  auto len = json_ext->json_path(kData, kDocument.size(), kPath, 9, kOut, 64);
  ASSERT_EQ(len, 7);
  EXPECT_EQ(asString(memory().view(kOut, 7).value()), R"("Alice")");
}

TEST_F(JsonExtensionTest, SoftErrors) {
  writePath("user.nope");
  EXPECT_EQ(json_ext->json_path(kData, kDocument.size(), kPath, 9, kOut, 64),
            JsonExtension::kNotFound);
  writePath("user.name");
  EXPECT_EQ(json_ext->json_path(kData, kDocument.size(), kPath, 9, kOut, 3),
            JsonExtension::kBufferTooSmall);
}

/**
 * @given malformed document or out of bounds arguments
 * @when json_path is called
 * @then it throws, which aborts the execution
 */
TEST_F(JsonExtensionTest, HardFailuresThrow) {
  writePath("user");
  EXPECT_THROW(json_ext->json_path(kData, 5, kPath, 4, kOut, 64),
               std::runtime_error);
  EXPECT_THROW(json_ext->json_path(
                   kData, kDocument.size(), kPath, 4, 65530, 64),
               std::runtime_error);
}

/**
 * @given a megabyte of '[' in guest memory
 * @when json_path is called on it
 * @then it fails as a hard host failure instead of exhausting the stack
 */
TEST_F(JsonExtensionTest, DeepDocumentThrows) {
  constexpr uint32_t kNested = 4096;
  constexpr uint32_t kNestedLen = 1'000'000;
  ASSERT_TRUE(memory().resize(kNested + kNestedLen));
  sealbox::common::Buffer nested(kNestedLen, '[');
  ASSERT_TRUE(memory().storeBuffer(kNested, nested));
  EXPECT_THROW(json_ext->json_path(kNested, kNestedLen, kPath, 0, kOut, 64),
               std::runtime_error);
}
