/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/crypto_extension.hpp"

#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/random/chacha20_stream.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/runtime/memory.hpp"

using namespace sealbox::host_api;
using sealbox::common::Buffer;
using sealbox::crypto::HasherImpl;
using testutil::TestMemoryProvider;

class CryptoExtensionTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  void SetUp() override {
    memory_provider = std::make_shared<TestMemoryProvider>();
    seed.fill(7);
    crypto_ext = std::make_unique<CryptoExtension>(
        memory_provider, hasher, seed);
  }

  testutil::TestMemory &memory() {
    return memory_provider->memory();
  }

  std::shared_ptr<TestMemoryProvider> memory_provider;
  std::shared_ptr<HasherImpl> hasher = std::make_shared<HasherImpl>();
  HostEnvironment::Seed seed{};
  std::unique_ptr<CryptoExtension> crypto_ext;
};

/**
 * @given bytes in guest memory
 * @when hash_commit is called
 * @then the SHA-256 digest is written to the output
 */
TEST_F(CryptoExtensionTest, HashCommit) {
  Buffer abc{'a', 'b', 'c'};
  ASSERT_TRUE(memory().storeBuffer(16, abc));
  ASSERT_EQ(crypto_ext->hash_commit(16, 3, 100), CryptoExtension::kHashSize);
  auto written = memory().loadN(100, 32).value();
  EXPECT_EQ(Buffer(hasher->sha2_256(abc).view().begin(),
                   hasher->sha2_256(abc).view().end()),
            written);
}

TEST_F(CryptoExtensionTest, HashCommitOutOfBoundsThrows) {
  EXPECT_THROW(crypto_ext->hash_commit(0, 70000, 100), std::runtime_error);
  EXPECT_THROW(crypto_ext->hash_commit(0, 3, 65530), std::runtime_error);
}

/**
 * @given extension seeded with a fixed seed
 * @when random bytes are requested in two calls
 * @then they continue the ChaCha20 keystream of that seed
 */
TEST_F(CryptoExtensionTest, RandomBytesFollowSeededStream) {
  ASSERT_EQ(crypto_ext->random_bytes(0, 10), 10);
  ASSERT_EQ(crypto_ext->random_bytes(10, 22), 22);

  auto stream = sealbox::crypto::ChaCha20Stream::create(seed).value();
  Buffer expected(32);
  ASSERT_TRUE(stream->fill(expected));
  EXPECT_EQ(memory().loadN(0, 32).value(), expected);
}

TEST_F(CryptoExtensionTest, RandomBytesOutOfBoundsThrows) {
  EXPECT_THROW(crypto_ext->random_bytes(65500, 100), std::runtime_error);
}
