/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/module_cache.hpp"

namespace sealbox::runtime {

  ModuleCache::ModuleCache(size_t capacity)
      : modules_{capacity},
        logger_{log::createLogger("ModuleCache", "module_cache")} {}

  std::shared_ptr<const Module> ModuleCache::get(
      const common::Hash256 &digest) const {
    std::lock_guard lock{mutex_};
    auto module = modules_.get(digest);
    if (not module) {
      SL_TRACE(logger_, "Cache miss for module {}", digest);
      return nullptr;
    }
    SL_TRACE(logger_, "Cache hit for module {}", digest);
    return module->get();
  }

  void ModuleCache::put(const common::Hash256 &digest,
                        std::shared_ptr<const Module> module) {
    std::lock_guard lock{mutex_};
    if (modules_.size() == modules_.capacity()
        and not modules_.contains(digest)) {
      SL_DEBUG(logger_,
               "Module cache is full ({} entries), evicting the least "
               "recently used",
               modules_.capacity());
    }
    modules_.put(digest, std::move(module));
  }

  size_t ModuleCache::size() const {
    std::lock_guard lock{mutex_};
    return modules_.size();
  }

  size_t ModuleCache::capacity() const {
    return modules_.capacity();
  }

}  // namespace sealbox::runtime
