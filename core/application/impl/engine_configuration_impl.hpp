/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/engine_configuration.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string_view>

#include <rapidjson/document.h>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace sealbox::application {

  // clang-format off
  /**
   * Reads engine configuration with the given priority:
   *
   *        CONFIGURATION FILE          <- max priority
   *                V
   *          LIMITS PRESET
   *                V
   *          DEFAULT VALUES            <- low priority
   */
  // clang-format on
  class EngineConfigurationImpl final : public EngineConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    EngineConfigurationImpl();

    /**
     * Reads the JSON file at \param path, segments absent from the file
     * keep their defaults
     */
    outcome::result<void> loadFile(const std::filesystem::path &path);

    outcome::result<void> loadString(std::string_view json);

    const runtime::ResourceLimits &limits() const override {
      return limits_;
    }

    size_t moduleCacheSize() const override {
      return module_cache_size_;
    }

    size_t maxIoSize() const override {
      return max_io_size_;
    }

    FailurePolicy failurePolicy() const override {
      return record_failures_ ? FailurePolicy::SIGNED_FAILURE_RECEIPT
                              : FailurePolicy::NO_RECEIPT;
    }

    const std::vector<std::string> &log() const override {
      return log_;
    }

   private:
    outcome::result<void> load(const rapidjson::Document &document);
    outcome::result<void> parse_limits_segment(const rapidjson::Value &val);
    outcome::result<void> parse_runtime_segment(const rapidjson::Value &val);
    outcome::result<void> parse_log_segment(const rapidjson::Value &val);

    runtime::ResourceLimits limits_;
    size_t module_cache_size_;
    size_t max_io_size_;
    bool record_failures_;
    std::vector<std::string> log_;
    log::Logger logger_;
  };

}  // namespace sealbox::application
