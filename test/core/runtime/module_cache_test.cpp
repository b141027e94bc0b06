/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/module_cache.hpp"

#include <thread>

#include <gtest/gtest.h>

#include "mock/runtime/module_mock.hpp"
#include "testutil/prepare_loggers.hpp"

using sealbox::common::Hash256;
using sealbox::runtime::ModuleCache;
using sealbox::runtime::ModuleMock;

class ModuleCacheTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  static Hash256 digest(uint8_t n) {
    Hash256 h;
    h[0] = n;
    return h;
  }
};

/**
 * @given cache of capacity 2 holding two modules
 * @when the older one is used and a third is inserted
 * @then the least recently used module is evicted
 */
TEST_F(ModuleCacheTest, EvictsLeastRecentlyUsed) {
  ModuleCache cache{2};
  auto a = std::make_shared<ModuleMock>();
  auto b = std::make_shared<ModuleMock>();
  auto c = std::make_shared<ModuleMock>();

  cache.put(digest(1), a);
  cache.put(digest(2), b);
  EXPECT_EQ(cache.get(digest(1)), a);
  cache.put(digest(3), c);

  EXPECT_EQ(cache.size(), 2);
  EXPECT_EQ(cache.capacity(), 2);
  EXPECT_EQ(cache.get(digest(1)), a);
  EXPECT_EQ(cache.get(digest(2)), nullptr);
  EXPECT_EQ(cache.get(digest(3)), c);
}

TEST_F(ModuleCacheTest, PutSameDigestReplaces) {
  ModuleCache cache{2};
  auto a = std::make_shared<ModuleMock>();
  auto b = std::make_shared<ModuleMock>();
  cache.put(digest(1), a);
  cache.put(digest(1), b);
  EXPECT_EQ(cache.size(), 1);
  EXPECT_EQ(cache.get(digest(1)), b);
}

TEST_F(ModuleCacheTest, ConcurrentAccess) {
  ModuleCache cache{4};
  auto module = std::make_shared<ModuleMock>();
  std::vector<std::thread> threads;
  for (uint8_t t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (uint8_t i = 0; i < 100; ++i) {
        cache.put(digest(static_cast<uint8_t>(t * 100 + i % 8)), module);
        cache.get(digest(i % 8));
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  EXPECT_LE(cache.size(), 4);
}
