/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

#include <boost/assert.hpp>
#include <libp2p/log/logger.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::log, Error, e) {
  using E = sealbox::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
    case E::WRONG_GROUP:
      return "Unknown log group";
    case E::NOT_READY:
      return "Logging system is not set";
  }
  return "Unknown log::Error";
}

namespace sealbox::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "sealbox::log::setLoggingSystem() was not called");
      return logging_system;
    }

    constexpr std::array<std::pair<std::string_view, Level>, 14> kLevelNames{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
        {"no", Level::OFF},
        {"none", Level::OFF},
    }};
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
    libp2p::log::setLoggingSystem(logging_system_.lock());
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &entries) {
    auto logging_system = logging_system_.lock();
    if (not logging_system) {
      return Error::NOT_READY;
    }
    for (std::string_view entry : entries) {
      std::string group{defaultGroupName};
      auto eq = entry.find('=');
      if (eq != std::string_view::npos) {
        group = entry.substr(0, eq);
        entry.remove_prefix(eq + 1);
      }
      OUTCOME_TRY(level, str2lvl(entry));
      if (not logging_system->getGroup(group)) {
        return Error::WRONG_GROUP;
      }
      logging_system->setLevelOfGroup(group, level);
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag) {
    return createLogger(tag, defaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem())
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

}  // namespace sealbox::log
