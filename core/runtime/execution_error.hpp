/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace sealbox::runtime {

  /**
   * Reasons an execution terminates without output
   */
  enum class ExecutionError : uint8_t {
    TRAP = 1,
    TIMEOUT,
    RESOURCE_EXCEEDED_FUEL,
    RESOURCE_EXCEEDED_MEMORY,
    HOST_FUNCTION_FAILURE,
    IO_LIMIT,
  };

}  // namespace sealbox::runtime

OUTCOME_HPP_DECLARE_ERROR(sealbox::runtime, ExecutionError);
