/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/wasm_edge/module_factory_impl.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <limits>

#include <boost/assert.hpp>
#include <wasmedge/wasmedge.h>

#include "host_api/host_api_factory.hpp"
#include "runtime/execution_error.hpp"
#include "runtime/module.hpp"
#include "runtime/module_instance.hpp"
#include "runtime/module_validator.hpp"
#include "runtime/validation_error.hpp"
#include "runtime/wasm_edge/memory_impl.hpp"
#include "runtime/wasm_edge/register_host_api.hpp"
#include "runtime/wasm_edge/wrappers.hpp"

namespace sealbox::runtime::wasm_edge {

  namespace {
    host_api::ValType convertType(WasmEdge_ValType type) {
      if (WasmEdge_ValTypeIsI32(type)) {
        return host_api::ValType::I32;
      }
      if (WasmEdge_ValTypeIsI64(type)) {
        return host_api::ValType::I64;
      }
      return host_api::ValType::OTHER;
    }

    host_api::ImportKind convertKind(WasmEdge_ExternalType type) {
      switch (type) {
        case WasmEdge_ExternalType_Function:
          return host_api::ImportKind::FUNCTION;
        case WasmEdge_ExternalType_Table:
          return host_api::ImportKind::TABLE;
        case WasmEdge_ExternalType_Memory:
          return host_api::ImportKind::MEMORY;
        case WasmEdge_ExternalType_Global:
          return host_api::ImportKind::GLOBAL;
        default:
          return host_api::ImportKind::OTHER;
      }
    }

    host_api::FunctionSignature convertSignature(
        const WasmEdge_FunctionTypeContext *type) {
      BOOST_ASSERT(type != nullptr);
      std::vector<WasmEdge_ValType> params(
          WasmEdge_FunctionTypeGetParametersLength(type));
      std::vector<WasmEdge_ValType> rets(
          WasmEdge_FunctionTypeGetReturnsLength(type));
      WasmEdge_FunctionTypeGetParameters(type, params.data(), params.size());
      WasmEdge_FunctionTypeGetReturns(type, rets.data(), rets.size());

      host_api::FunctionSignature signature;
      std::ranges::transform(
          params, std::back_inserter(signature.params), convertType);
      std::ranges::transform(
          rets, std::back_inserter(signature.results), convertType);
      return signature;
    }

    std::vector<host_api::ImportDescriptor> listImports(
        const WasmEdge_ASTModuleContext *module) {
      uint32_t imports_num = WasmEdge_ASTModuleListImportsLength(module);
      std::vector<const WasmEdge_ImportTypeContext *> imports(imports_num);
      WasmEdge_ASTModuleListImports(module, imports.data(), imports_num);

      std::vector<host_api::ImportDescriptor> result;
      result.reserve(imports_num);
      for (auto *import : imports) {
        host_api::ImportDescriptor descriptor{
            .module_name = toString(WasmEdge_ImportTypeGetModuleName(import)),
            .name = toString(WasmEdge_ImportTypeGetExternalName(import)),
            .kind = convertKind(WasmEdge_ImportTypeGetExternalType(import)),
            .signature = std::nullopt,
        };
        if (descriptor.kind == host_api::ImportKind::FUNCTION) {
          descriptor.signature = convertSignature(
              WasmEdge_ImportTypeGetFunctionType(module, import));
        }
        result.emplace_back(std::move(descriptor));
      }
      return result;
    }

    std::vector<ExportDescriptor> listExports(
        const WasmEdge_ASTModuleContext *module) {
      uint32_t exports_num = WasmEdge_ASTModuleListExportsLength(module);
      std::vector<const WasmEdge_ExportTypeContext *> exports(exports_num);
      WasmEdge_ASTModuleListExports(module, exports.data(), exports_num);

      std::vector<ExportDescriptor> result;
      result.reserve(exports_num);
      for (auto *e : exports) {
        ExportDescriptor descriptor{
            .name = toString(WasmEdge_ExportTypeGetExternalName(e)),
            .kind = convertKind(WasmEdge_ExportTypeGetExternalType(e)),
            .signature = std::nullopt,
            .memory_min_pages = std::nullopt,
        };
        if (descriptor.kind == host_api::ImportKind::FUNCTION) {
          descriptor.signature =
              convertSignature(WasmEdge_ExportTypeGetFunctionType(module, e));
        } else if (descriptor.kind == host_api::ImportKind::MEMORY) {
          auto memory_type = WasmEdge_ExportTypeGetMemoryType(module, e);
          if (memory_type != nullptr) {
            descriptor.memory_min_pages =
                WasmEdge_MemoryTypeGetLimit(memory_type).Min;
          }
        }
        result.emplace_back(std::move(descriptor));
      }
      return result;
    }

    ConfigureContext configureCtx() {
      ConfigureContext ctx{WasmEdge_ConfigureCreate()};
      // capsules run single threaded
      WasmEdge_ConfigureRemoveProposal(ctx.raw(), WasmEdge_Proposal_Threads);
      return ctx;
    }

    constexpr uint8_t kStartSectionId = 8;

    /**
     * Walks the section headers of a binary WasmEdge already accepted.
     * WasmEdge runs the start function inside the synchronous instantiation,
     * where no deadline can interrupt it, so it is looked up here.
     */
    bool hasStartSection(common::BufferView code) {
      // magic and version
      size_t pos = 8;
      while (pos < code.size()) {
        auto id = code[pos++];
        uint64_t size = 0;
        for (unsigned shift = 0;; shift += 7) {
          if (pos >= code.size() or shift > 28) {
            return false;
          }
          auto byte = code[pos++];
          size |= static_cast<uint64_t>(byte & 0x7f) << shift;
          if ((byte & 0x80) == 0) {
            break;
          }
        }
        if (id == kStartSectionId) {
          return true;
        }
        if (size > code.size() - pos) {
          return false;
        }
        pos += size;
      }
      return false;
    }

    bool isCode(WasmEdge_Result res, WasmEdge_ErrCode code) {
      return WasmEdge_ResultGetCategory(res) == WasmEdge_ErrCategory_WASM
         and WasmEdge_ResultGetCode(res) == static_cast<uint32_t>(code);
    }
  }  // namespace

  class ModuleInstanceImpl : public ModuleInstance {
   public:
    ModuleInstanceImpl(std::shared_ptr<const Module> module,
                       InstanceConfig config,
                       StatsContext stats,
                       ExecutorContext executor,
                       StoreContext store,
                       ModuleInstanceContext host_instance,
                       ModuleInstanceContext instance,
                       InstanceEnvironment env)
        : module_{std::move(module)},
          config_{config},
          stats_{std::move(stats)},
          executor_{std::move(executor)},
          store_{std::move(store)},
          host_instance_{std::move(host_instance)},
          instance_{std::move(instance)},
          env_{std::move(env)} {
      BOOST_ASSERT(module_ != nullptr);
      BOOST_ASSERT(instance_ != nullptr);
      BOOST_ASSERT(executor_ != nullptr);
      BOOST_ASSERT(env_.host_api != nullptr);
    }

    std::shared_ptr<const Module> getModule() const override {
      return module_;
    }

    outcome::result<common::Buffer> callRun(common::BufferView input,
                                            std::chrono::milliseconds timeout,
                                            size_t max_io_size) override {
      if (input.size() > max_io_size
          or input.size() > std::numeric_limits<WasmSize>::max() - kInputOffset) {
        return ExecutionError::IO_LIMIT;
      }
      auto memory_opt = env_.memory_provider->getCurrentMemory();
      BOOST_ASSERT(memory_opt);
      auto &memory = memory_opt->get();

      auto input_size = static_cast<WasmSize>(input.size());
      auto input_end = static_cast<uint64_t>(kInputOffset) + input_size;
      if (sizeToPages(input_end) > config_.max_memory_pages) {
        SL_DEBUG(log_,
                 "Input of {} bytes does not fit {} memory pages",
                 input_size,
                 config_.max_memory_pages);
        return ExecutionError::RESOURCE_EXCEEDED_MEMORY;
      }
      if (auto res = memory.resize(static_cast<WasmSize>(input_end)); !res) {
        return ExecutionError::RESOURCE_EXCEEDED_MEMORY;
      }
      if (auto res = memory.storeBuffer(kInputOffset, input); !res) {
        return ExecutionError::RESOURCE_EXCEEDED_MEMORY;
      }

      String run_name = makeString(ModuleValidator::kEntryPoint);
      auto func =
          WasmEdge_ModuleInstanceFindFunction(instance_.raw(), run_name.raw());
      if (func == nullptr) {
        return ExecutionError::TRAP;
      }

      std::array params{
          WasmEdge_ValueGenI32(static_cast<int32_t>(kInputOffset)),
          WasmEdge_ValueGenI32(static_cast<int32_t>(input_size))};
      std::array returns{WasmEdge_ValueGenI32(0)};

      AsyncContext async = WasmEdge_ExecutorAsyncInvoke(
          executor_.raw(), func, params.data(), params.size());
      bool timed_out = false;
      if (not WasmEdge_AsyncWaitFor(async.raw(),
                                    static_cast<uint64_t>(timeout.count()))) {
        WasmEdge_AsyncCancel(async.raw());
        timed_out = true;
      }
      auto res =
          WasmEdge_AsyncGet(async.raw(), returns.data(), returns.size());

      if (timed_out) {
        SL_DEBUG(log_, "Call of run interrupted after {} ms", timeout.count());
        return ExecutionError::TIMEOUT;
      }
      if (not WasmEdge_ResultOK(res)) {
        return classifyFailure(res);
      }

      auto span = PtrSize::unpack(WasmEdge_ValueGetI32(returns[0]));
      if (span.size > max_io_size) {
        return ExecutionError::IO_LIMIT;
      }
      auto output = memory.loadN(span.ptr, span.size);
      if (not output) {
        SL_DEBUG(log_,
                 "Output [{}, +{}) is out of memory bounds",
                 span.ptr,
                 span.size);
        return ExecutionError::TRAP;
      }
      return std::move(output.value());
    }

    uint64_t fuelUsed() const override {
      return std::min(WasmEdge_StatisticsGetTotalCost(stats_.raw()),
                      config_.fuel_limit);
    }

    uint32_t memoryPages() const override {
      if (auto memory = env_.memory_provider->getCurrentMemory()) {
        return memory->get().pages();
      }
      return 0;
    }

    const InstanceEnvironment &getEnvironment() const override {
      return env_;
    }

    /**
     * Maps a failed call to the reason the capsule was stopped
     */
    ExecutionError classifyFailure(WasmEdge_Result res) const {
      SL_DEBUG(log_, "Capsule trapped: {}", WasmEdge_ResultGetMessage(res));
      if (isCode(res, WasmEdge_ErrCode_Interrupted)) {
        return ExecutionError::TIMEOUT;
      }
      if (isCode(res, WasmEdge_ErrCode_CostLimitExceeded)) {
        return ExecutionError::RESOURCE_EXCEEDED_FUEL;
      }
      if (env_.host_api->failure()) {
        SL_DEBUG(log_, "Host function failed: {}", *env_.host_api->failure());
        return ExecutionError::HOST_FUNCTION_FAILURE;
      }
      if (memoryPages() >= config_.max_memory_pages) {
        return ExecutionError::RESOURCE_EXCEEDED_MEMORY;
      }
      return ExecutionError::TRAP;
    }

   private:
    std::shared_ptr<const Module> module_;
    InstanceConfig config_;
    StatsContext stats_;
    ExecutorContext executor_;
    StoreContext store_;
    ModuleInstanceContext host_instance_;
    ModuleInstanceContext instance_;
    InstanceEnvironment env_;
    log::Logger log_ = log::createLogger("ModuleInstance", "wasmedge");
  };

  class ModuleImpl : public Module,
                     public std::enable_shared_from_this<ModuleImpl> {
   public:
    ModuleImpl(ASTModuleContext module,
               common::Hash256 digest,
               size_t code_size,
               bool has_start)
        : module_{std::move(module)},
          digest_{digest},
          code_size_{code_size},
          has_start_{has_start},
          imports_{listImports(module_.raw())},
          exports_{listExports(module_.raw())} {
      BOOST_ASSERT(module_ != nullptr);
    }

    const common::Hash256 &digest() const override {
      return digest_;
    }

    size_t codeSize() const override {
      return code_size_;
    }

    const std::vector<host_api::ImportDescriptor> &imports() const override {
      return imports_;
    }

    const std::vector<ExportDescriptor> &exports() const override {
      return exports_;
    }

    bool hasStartFunction() const override {
      return has_start_;
    }

    outcome::result<std::shared_ptr<ModuleInstance>> instantiate(
        const InstanceConfig &config,
        const host_api::HostApiFactory &host_api_factory,
        const host_api::BoundImports &bound_imports,
        const host_api::HostEnvironment &environment) const override {
      if (has_start_) {
        SL_DEBUG(
            log_, "Refusing to instantiate {} with a start function", digest_);
        return ValidationError::START_FUNCTION;
      }
      auto configure_ctx = configureCtx();
      WasmEdge_ConfigureSetMaxMemoryPage(configure_ctx.raw(),
                                         config.max_memory_pages);
      WasmEdge_ConfigureStatisticsSetInstructionCounting(configure_ctx.raw(),
                                                         true);
      WasmEdge_ConfigureStatisticsSetCostMeasuring(configure_ctx.raw(), true);

      StatsContext stats = WasmEdge_StatisticsCreate();
      WasmEdge_StatisticsSetCostLimit(stats.raw(), config.fuel_limit);
      ExecutorContext executor =
          WasmEdge_ExecutorCreate(configure_ctx.raw(), stats.raw());
      StoreContext store = WasmEdge_StoreCreate();

      String env_name = makeString(host_api::kHostNamespace);
      ModuleInstanceContext host_instance =
          WasmEdge_ModuleInstanceCreate(env_name.raw());

      auto memory_provider = std::make_shared<InternalMemoryProviderImpl>();
      InstanceEnvironment env{
          .memory_provider = memory_provider,
          .host_api = host_api_factory.make(
              memory_provider, bound_imports, environment),
      };

      registerHostApi(*env.host_api, bound_imports, host_instance.raw());
      if (auto res = WasmEdge_ExecutorRegisterImport(
              executor.raw(), store.raw(), host_instance.raw());
          not WasmEdge_ResultOK(res)) {
        SL_ERROR(log_,
                 "Failed to register host functions: {}",
                 WasmEdge_ResultGetMessage(res));
        return ExecutionError::TRAP;
      }

      ModuleInstanceContext instance_ctx;
      if (auto res = WasmEdge_ExecutorInstantiate(
              executor.raw(), &instance_ctx.raw(), store.raw(), module_.raw());
          not WasmEdge_ResultOK(res)) {
        SL_DEBUG(log_,
                 "Failed to instantiate {}: {}",
                 digest_,
                 WasmEdge_ResultGetMessage(res));
        if (isCode(res, WasmEdge_ErrCode_CostLimitExceeded)) {
          return ExecutionError::RESOURCE_EXCEEDED_FUEL;
        }
        if (env.host_api->failure()) {
          return ExecutionError::HOST_FUNCTION_FAILURE;
        }
        return ExecutionError::TRAP;
      }

      String memory_name = makeString(ModuleValidator::kMemoryExport);
      auto memory_ctx = WasmEdge_ModuleInstanceFindMemory(instance_ctx.raw(),
                                                          memory_name.raw());
      if (memory_ctx == nullptr) {
        SL_ERROR(log_, "Instance of {} exports no memory", digest_);
        return ExecutionError::TRAP;
      }
      memory_provider->setMemory(memory_ctx);

      return std::make_shared<ModuleInstanceImpl>(shared_from_this(),
                                                  config,
                                                  std::move(stats),
                                                  std::move(executor),
                                                  std::move(store),
                                                  std::move(host_instance),
                                                  std::move(instance_ctx),
                                                  std::move(env));
    }

   private:
    ASTModuleContext module_;
    common::Hash256 digest_;
    size_t code_size_;
    bool has_start_;
    std::vector<host_api::ImportDescriptor> imports_;
    std::vector<ExportDescriptor> exports_;
    log::Logger log_ = log::createLogger("Module", "wasmedge");
  };

  ModuleFactoryImpl::ModuleFactoryImpl()
      : log_{log::createLogger("ModuleFactory", "wasmedge")} {}

  outcome::result<std::shared_ptr<const Module>> ModuleFactoryImpl::make(
      common::BufferView code, const common::Hash256 &digest) const {
    if (code.size() > std::numeric_limits<uint32_t>::max()) {
      return ValidationError::MALFORMED;
    }
    auto configure_ctx = configureCtx();
    LoaderContext loader_ctx = WasmEdge_LoaderCreate(configure_ctx.raw());
    ASTModuleContext module;
    if (auto res = WasmEdge_LoaderParseFromBuffer(
            loader_ctx.raw(),
            &module.raw(),
            code.data(),
            static_cast<uint32_t>(code.size()));
        not WasmEdge_ResultOK(res)) {
      SL_DEBUG(log_,
               "Module {} is not parseable: {}",
               digest,
               WasmEdge_ResultGetMessage(res));
      return ValidationError::MALFORMED;
    }

    ValidatorContext validator = WasmEdge_ValidatorCreate(configure_ctx.raw());
    if (auto res = WasmEdge_ValidatorValidate(validator.raw(), module.raw());
        not WasmEdge_ResultOK(res)) {
      SL_DEBUG(log_,
               "Module {} is not valid: {}",
               digest,
               WasmEdge_ResultGetMessage(res));
      return ValidationError::MALFORMED;
    }

    return std::make_shared<ModuleImpl>(
        std::move(module), digest, code.size(), hasStartSection(code));
  }

}  // namespace sealbox::runtime::wasm_edge
