/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/config_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::application, ConfigError, e) {
  using E = sealbox::application::ConfigError;
  switch (e) {
    case E::FILE_NOT_FOUND:
      return "Configuration file can not be opened";
    case E::PARSE_FAILED:
      return "Configuration is not a valid JSON object";
    case E::INVALID_VALUE:
      return "Configuration value has a wrong type or is out of range";
    case E::UNKNOWN_CAPABILITY:
      return "Unknown capability name";
    case E::UNKNOWN_PRESET:
      return "Unknown limits preset";
  }
  return "Unknown ConfigError";
}
