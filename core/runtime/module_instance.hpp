/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>

#include "common/buffer.hpp"
#include "host_api/host_api.hpp"
#include "outcome/outcome.hpp"
#include "runtime/memory_provider.hpp"

namespace sealbox::runtime {

  class Module;

  struct InstanceEnvironment {
    std::shared_ptr<MemoryProvider> memory_provider;
    std::shared_ptr<host_api::HostApi> host_api;
  };

  /**
   * Single-use instance of a capsule
   */
  class ModuleInstance {
   public:
    virtual ~ModuleInstance() = default;

    virtual std::shared_ptr<const Module> getModule() const = 0;

    /**
     * Writes \param input at kInputOffset, calls `run(ptr, len)` and reads
     * the packed result.
     * @param timeout wall-clock budget of the call
     * @param max_io_size bound for both input and output
     * @return output bytes or ExecutionError
     */
    virtual outcome::result<common::Buffer> callRun(
        common::BufferView input,
        std::chrono::milliseconds timeout,
        size_t max_io_size) = 0;

    /// Fuel consumed by instantiation and the call so far
    virtual uint64_t fuelUsed() const = 0;

    /// Current size of linear memory, which never shrinks
    virtual uint32_t memoryPages() const = 0;

    virtual const InstanceEnvironment &getEnvironment() const = 0;
  };

}  // namespace sealbox::runtime
