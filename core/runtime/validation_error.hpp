/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace sealbox::runtime {

  enum class ValidationError : uint8_t {
    TOO_LARGE = 1,
    MALFORMED,
    MISSING_EXPORT,
    UNAUTHORIZED_IMPORT,
    START_FUNCTION,
  };

}  // namespace sealbox::runtime

OUTCOME_HPP_DECLARE_ERROR(sealbox::runtime, ValidationError);
