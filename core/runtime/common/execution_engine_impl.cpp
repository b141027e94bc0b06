/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/common/execution_engine_impl.hpp"

#include <chrono>

#include <boost/assert.hpp>

#include "host_api/host_api.hpp"
#include "host_api/host_api_factory.hpp"
#include "runtime/module_cache.hpp"
#include "runtime/module_factory.hpp"
#include "runtime/module_instance.hpp"

namespace sealbox::runtime {

  namespace {
    double pagesToMb(uint32_t pages) {
      return static_cast<double>(pages) * kMemoryPageSize / (1024.0 * 1024.0);
    }
  }  // namespace

  ExecutionEngineImpl::ExecutionEngineImpl(
      std::shared_ptr<const ModuleFactory> module_factory,
      std::shared_ptr<ModuleCache> module_cache,
      std::shared_ptr<const host_api::HostApiFactory> host_api_factory,
      size_t max_io_size)
      : module_factory_{std::move(module_factory)},
        module_cache_{std::move(module_cache)},
        host_api_factory_{std::move(host_api_factory)},
        max_io_size_{max_io_size},
        logger_{log::createLogger("ExecutionEngine", "runtime")} {
    BOOST_ASSERT(module_factory_ != nullptr);
    BOOST_ASSERT(host_api_factory_ != nullptr);
  }

  outcome::result<std::shared_ptr<const Module>> ExecutionEngineImpl::getModule(
      const CapsuleModule &capsule) const {
    if (module_cache_) {
      if (auto cached = module_cache_->get(capsule.id)) {
        return cached;
      }
    }
    OUTCOME_TRY(module, module_factory_->make(capsule.code, capsule.id));
    if (module_cache_) {
      module_cache_->put(capsule.id, module);
    }
    return module;
  }

  outcome::result<Execution> ExecutionEngineImpl::execute(
      const CapsuleModule &capsule,
      const host_api::BoundImports &bound_imports,
      common::BufferView input,
      const ResourceLimits &limits,
      const host_api::HostEnvironment &environment,
      ExecMetrics *metrics_out,
      std::vector<host_api::AccessRecord> *access_log_out) const {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::steady_clock;

    auto started = steady_clock::now();
    ExecMetrics metrics;
    std::vector<host_api::AccessRecord> access_log;
    std::shared_ptr<ModuleInstance> instance;

    auto finish = [&](outcome::result<common::Buffer> res)
        -> outcome::result<Execution> {
      metrics.duration_ms = static_cast<uint64_t>(
          duration_cast<milliseconds>(steady_clock::now() - started).count());
      if (instance) {
        metrics.fuel_used = instance->fuelUsed();
        metrics.memory_mb = pagesToMb(instance->memoryPages());
        auto &host_api = *instance->getEnvironment().host_api;
        metrics.host_calls = host_api.hostCalls();
        access_log = host_api.accessLog().records();
      }
      if (metrics_out != nullptr) {
        *metrics_out = metrics;
      }
      if (access_log_out != nullptr) {
        *access_log_out = access_log;
      }
      if (res.has_error()) {
        SL_DEBUG(logger_,
                 "Capsule {} failed: {}; fuel {}, memory {:.3f} MB, {} ms, "
                 "{} host calls",
                 capsule.id,
                 res.error().message(),
                 metrics.fuel_used,
                 metrics.memory_mb,
                 metrics.duration_ms,
                 metrics.host_calls);
        return res.error();
      }
      SL_DEBUG(logger_,
               "Capsule {} produced {} bytes; fuel {}, memory {:.3f} MB, {} "
               "ms, {} host calls",
               capsule.id,
               res.value().size(),
               metrics.fuel_used,
               metrics.memory_mb,
               metrics.duration_ms,
               metrics.host_calls);
      return Execution{
          std::move(res.value()), metrics, std::move(access_log)};
    };

    if (input.size() > max_io_size_) {
      return finish(ExecutionError::IO_LIMIT);
    }

    auto module_res = getModule(capsule);
    if (not module_res) {
      return finish(module_res.error());
    }
    auto &module = module_res.value();

    InstanceConfig config{
        .max_memory_pages = limits.maxMemoryPages(),
        .fuel_limit = limits.fuel_limit,
    };
    for (auto &e : module->exports()) {
      if (e.memory_min_pages and *e.memory_min_pages > config.max_memory_pages) {
        SL_DEBUG(logger_,
                 "Capsule {} declares {} initial memory pages, ceiling is {}",
                 capsule.id,
                 *e.memory_min_pages,
                 config.max_memory_pages);
        return finish(ExecutionError::RESOURCE_EXCEEDED_MEMORY);
      }
    }

    auto instance_res = module->instantiate(
        config, *host_api_factory_, bound_imports, environment);
    if (not instance_res) {
      return finish(instance_res.error());
    }
    instance = std::move(instance_res.value());

    return finish(instance->callRun(
        input, milliseconds{limits.execution_time_ms}, max_io_size_));
  }

}  // namespace sealbox::runtime
