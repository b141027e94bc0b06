/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

namespace sealbox::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, NOT_READY };

  /// Root of the group tree, see log::Configurator
  inline const std::string defaultGroupName{"sealbox"};

  /**
   * Accepts full level names and the short forms (warn, err, crit, no)
   */
  outcome::result<Level> str2lvl(std::string_view str);

  /**
   * Installs the logging system used by createLogger. Must happen once,
   * before any component is constructed.
   */
  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies level overrides, e.g. {"info", "runtime=debug"}.
   * A bare level is applied to the sealbox group, `group=level` to the named
   * group.
   * @return the first entry naming an unknown group or level fails the call,
   * entries before it stay applied
   */
  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &entries);

  [[nodiscard]] Logger createLogger(const std::string &tag);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace sealbox::log

OUTCOME_HPP_DECLARE_ERROR(sealbox::log, Error);
