/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/common/module_validator_impl.hpp"

#include <algorithm>

#include <boost/assert.hpp>
#include <fmt/format.h>

#include "host_api/capability_sandbox.hpp"
#include "runtime/module_factory.hpp"

namespace sealbox::runtime {

  namespace {
    bool isEntryPoint(const ExportDescriptor &e) {
      static const host_api::FunctionSignature kRunSignature{
          {host_api::ValType::I32, host_api::ValType::I32},
          {host_api::ValType::I32},
      };
      return e.name == ModuleValidator::kEntryPoint
         and e.kind == host_api::ImportKind::FUNCTION
         and e.signature == kRunSignature;
    }

    bool isMemory(const ExportDescriptor &e) {
      return e.name == ModuleValidator::kMemoryExport
         and e.kind == host_api::ImportKind::MEMORY;
    }
  }  // namespace

  ModuleValidatorImpl::ModuleValidatorImpl(
      std::shared_ptr<const ModuleFactory> module_factory,
      std::shared_ptr<const crypto::Hasher> hasher)
      : module_factory_{std::move(module_factory)},
        hasher_{std::move(hasher)},
        logger_{log::createLogger("ModuleValidator", "validator")} {
    BOOST_ASSERT(module_factory_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);
  }

  outcome::result<ValidationResult> ModuleValidatorImpl::validate(
      common::BufferView code, const ResourceLimits &limits) const {
    auto max_size = limits.maxModuleSizeBytes();
    if (code.size() > max_size) {
      SL_DEBUG(logger_,
               "Module of {} bytes exceeds the limit of {} bytes",
               code.size(),
               max_size);
      return ValidationError::TOO_LARGE;
    }

    OUTCOME_TRY(module, module_factory_->make(code, hasher_->sha2_256(code)));
    OUTCOME_TRY(checkInterface(*module, limits));

    ValidationResult result;
    result.size_bytes = code.size();
    for (auto &e : module->exports()) {
      result.exports.push_back(e.name);
    }
    for (auto &i : module->imports()) {
      result.imports.push_back(i.qualifiedName());
    }
    result.import_table = module->imports();
    if (static_cast<double>(code.size())
        > static_cast<double>(max_size) * kSizeWarningRatio) {
      result.warnings.push_back(
          fmt::format("Module size {:.1f} KB is approaching the limit of {} KB",
                      result.sizeKb(),
                      limits.max_module_size_kb));
    }
    SL_DEBUG(logger_,
             "Module {} accepted: {} bytes, {} exports, {} imports",
             module->digest(),
             result.size_bytes,
             result.exports.size(),
             result.imports.size());
    return result;
  }

  outcome::result<void> ModuleValidatorImpl::checkInterface(
      const Module &module, const ResourceLimits &limits) const {
    auto &exports = module.exports();
    if (std::ranges::none_of(exports, isEntryPoint)) {
      SL_DEBUG(logger_, "Module has no export `run(i32, i32) -> i32`");
      return ValidationError::MISSING_EXPORT;
    }
    if (std::ranges::none_of(exports, isMemory)) {
      SL_DEBUG(logger_, "Module has no memory export `memory`");
      return ValidationError::MISSING_EXPORT;
    }
    if (module.hasStartFunction()) {
      SL_DEBUG(logger_, "Module declares a start function");
      return ValidationError::START_FUNCTION;
    }

    host_api::CapabilitySandbox sandbox{limits.capabilities};
    for (auto &import : module.imports()) {
      if (import.kind != host_api::ImportKind::FUNCTION
          or not sandbox.allowsImport(import.module_name, import.name)) {
        SL_DEBUG(logger_,
                 "Import {} is not allowed under capabilities {}",
                 import.qualifiedName(),
                 limits.capabilities);
        return ValidationError::UNAUTHORIZED_IMPORT;
      }
    }
    return outcome::success();
  }

}  // namespace sealbox::runtime
