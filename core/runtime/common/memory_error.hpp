/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace sealbox::runtime {
  enum class MemoryError {
    OUT_OF_BOUNDS = 1,
    GROW_FAILED,
  };
}  // namespace sealbox::runtime

OUTCOME_HPP_DECLARE_ERROR(sealbox::runtime, MemoryError);
