/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>

#include <fmt/format.h>

#include "log/logger.hpp"

namespace sealbox::host_api {

  template <typename... Args>
  [[noreturn]] void throw_with_error(const log::Logger &logger,
                                     fmt::format_string<Args...> format,
                                     Args &&...args) {
    auto msg = fmt::format(format, std::forward<Args>(args)...);
    logger->warn(msg);
    throw std::runtime_error(msg);
  }

}  // namespace sealbox::host_api
