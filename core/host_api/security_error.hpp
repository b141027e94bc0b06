/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace sealbox::host_api {
  enum class SecurityError : uint8_t {
    CAPABILITY_DENIED = 1,
  };
}  // namespace sealbox::host_api

OUTCOME_HPP_DECLARE_ERROR(sealbox::host_api, SecurityError);
