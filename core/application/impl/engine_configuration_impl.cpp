/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/engine_configuration_impl.hpp"

#include <array>
#include <limits>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

#include "application/config_error.hpp"
#include "runtime/types.hpp"

namespace sealbox::application {

  namespace {
    /**
     * Reads an unsigned member no less than \param min.
     * An absent member leaves \param target unchanged.
     */
    template <typename T>
    outcome::result<void> load_uint(const rapidjson::Value &val,
                                    const char *name,
                                    T &target,
                                    T min = 1) {
      auto m = val.FindMember(name);
      if (m == val.MemberEnd()) {
        return outcome::success();
      }
      if (not m->value.IsUint64()) {
        return ConfigError::INVALID_VALUE;
      }
      auto v = m->value.GetUint64();
      if (v < min or v > std::numeric_limits<T>::max()) {
        return ConfigError::INVALID_VALUE;
      }
      target = static_cast<T>(v);
      return outcome::success();
    }

    outcome::result<void> load_bool(const rapidjson::Value &val,
                                    const char *name,
                                    bool &target) {
      auto m = val.FindMember(name);
      if (m == val.MemberEnd()) {
        return outcome::success();
      }
      if (not m->value.IsBool()) {
        return ConfigError::INVALID_VALUE;
      }
      target = m->value.GetBool();
      return outcome::success();
    }

    outcome::result<void> load_ms(const rapidjson::Value &val,
                                  std::vector<std::string> &target) {
      if (not val.IsArray()) {
        return ConfigError::INVALID_VALUE;
      }
      std::vector<std::string> result;
      for (auto &v : val.GetArray()) {
        if (not v.IsString()) {
          return ConfigError::INVALID_VALUE;
        }
        result.emplace_back(v.GetString(), v.GetStringLength());
      }
      target = std::move(result);
      return outcome::success();
    }
  }  // namespace

  EngineConfigurationImpl::EngineConfigurationImpl()
      : limits_{runtime::ResourceLimits::defaults()},
        module_cache_size_{kDefaultModuleCacheSize},
        max_io_size_{runtime::kDefaultMaxIoSize},
        record_failures_{false},
        logger_{log::createLogger("Configuration", "application")} {}

  outcome::result<void> EngineConfigurationImpl::loadFile(
      const std::filesystem::path &path) {
    FilePtr file{std::fopen(path.c_str(), "r"), &std::fclose};
    if (not file) {
      SL_ERROR(logger_, "Configuration file path is invalid: {}", path.string());
      return ConfigError::FILE_NOT_FOUND;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer{};
    FileReadStream input_stream(file.get(), buffer.data(), buffer.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               path.string(),
               GetParseError_En(document.GetParseError()));
      return ConfigError::PARSE_FAILED;
    }
    return load(document);
  }

  outcome::result<void> EngineConfigurationImpl::loadString(
      std::string_view json) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration parse failed with error {}",
               GetParseError_En(document.GetParseError()));
      return ConfigError::PARSE_FAILED;
    }
    return load(document);
  }

  outcome::result<void> EngineConfigurationImpl::load(
      const rapidjson::Document &document) {
    if (not document.IsObject()) {
      return ConfigError::PARSE_FAILED;
    }
    if (auto it = document.FindMember("limits"); it != document.MemberEnd()) {
      OUTCOME_TRY(parse_limits_segment(it->value));
    }
    if (auto it = document.FindMember("runtime"); it != document.MemberEnd()) {
      OUTCOME_TRY(parse_runtime_segment(it->value));
    }
    if (auto it = document.FindMember("log"); it != document.MemberEnd()) {
      OUTCOME_TRY(parse_log_segment(it->value));
    }
    SL_INFO(logger_,
            "Limits: {} MB, {} ms, {} fuel, modules up to {} KB, "
            "capabilities {}",
            limits_.memory_limit_mb,
            limits_.execution_time_ms,
            limits_.fuel_limit,
            limits_.max_module_size_kb,
            limits_.capabilities);
    return outcome::success();
  }

  outcome::result<void> EngineConfigurationImpl::parse_limits_segment(
      const rapidjson::Value &val) {
    if (not val.IsObject()) {
      return ConfigError::INVALID_VALUE;
    }
    auto limits = limits_;
    if (auto m = val.FindMember("preset"); m != val.MemberEnd()) {
      if (not m->value.IsString()) {
        return ConfigError::INVALID_VALUE;
      }
      std::string_view name{m->value.GetString(), m->value.GetStringLength()};
      auto preset = runtime::ResourceLimits::preset(name);
      if (not preset) {
        SL_ERROR(logger_, "Unknown limits preset '{}'", name);
        return ConfigError::UNKNOWN_PRESET;
      }
      limits = *preset;
    }

    OUTCOME_TRY(
        load_uint(val, "max_module_size_kb", limits.max_module_size_kb));
    OUTCOME_TRY(load_uint(val, "memory_limit_mb", limits.memory_limit_mb));
    OUTCOME_TRY(load_uint(val, "execution_time_ms", limits.execution_time_ms));
    OUTCOME_TRY(load_uint(val, "fuel_limit", limits.fuel_limit));

    if (auto m = val.FindMember("capabilities"); m != val.MemberEnd()) {
      std::vector<std::string> names;
      OUTCOME_TRY(load_ms(m->value, names));
      host_api::CapabilitySet capabilities;
      for (auto &name : names) {
        auto capability = host_api::capabilityFromName(name);
        if (not capability) {
          SL_ERROR(logger_, "Unknown capability '{}'", name);
          return ConfigError::UNKNOWN_CAPABILITY;
        }
        capabilities.insert(*capability);
      }
      limits.capabilities = capabilities;
    }

    limits_ = limits;
    return outcome::success();
  }

  outcome::result<void> EngineConfigurationImpl::parse_runtime_segment(
      const rapidjson::Value &val) {
    if (not val.IsObject()) {
      return ConfigError::INVALID_VALUE;
    }
    OUTCOME_TRY(load_uint(val, "module_cache_size", module_cache_size_));
    OUTCOME_TRY(load_uint(val, "max_io_size", max_io_size_));
    OUTCOME_TRY(load_bool(val, "record_failures", record_failures_));
    return outcome::success();
  }

  outcome::result<void> EngineConfigurationImpl::parse_log_segment(
      const rapidjson::Value &val) {
    return load_ms(val, log_);
  }

}  // namespace sealbox::application
