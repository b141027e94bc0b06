/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace sealbox::application {

  enum class ConfigError {
    FILE_NOT_FOUND = 1,
    PARSE_FAILED,
    INVALID_VALUE,
    UNKNOWN_CAPABILITY,
    UNKNOWN_PRESET,
  };

}  // namespace sealbox::application

OUTCOME_HPP_DECLARE_ERROR(sealbox::application, ConfigError);
