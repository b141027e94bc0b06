/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "common/blob.hpp"
#include "log/logger.hpp"
#include "runtime/module.hpp"
#include "utils/lru.hpp"

namespace sealbox::runtime {

  /**
   * @brief Bounded cache of parsed modules keyed by content digest, evicts
   * the least recently used entry. Cached modules are shared read-only,
   * lookups and inserts are serialized.
   */
  class ModuleCache {
   public:
    static constexpr size_t DEFAULT_CAPACITY = 16;

    explicit ModuleCache(size_t capacity = DEFAULT_CAPACITY);

    std::shared_ptr<const Module> get(const common::Hash256 &digest) const;

    void put(const common::Hash256 &digest,
             std::shared_ptr<const Module> module);

    size_t size() const;

    size_t capacity() const;

   private:
    // Lru updates recency on reads
    mutable std::mutex mutex_;
    mutable Lru<common::Hash256, std::shared_ptr<const Module>> modules_;
    log::Logger logger_;
  };

}  // namespace sealbox::runtime
