/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/execution_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::runtime, ExecutionError, e) {
  using E = sealbox::runtime::ExecutionError;
  switch (e) {
    case E::TRAP:
      return "Capsule trapped";
    case E::TIMEOUT:
      return "Capsule exceeded its execution time";
    case E::RESOURCE_EXCEEDED_FUEL:
      return "Capsule exceeded its fuel budget";
    case E::RESOURCE_EXCEEDED_MEMORY:
      return "Capsule exceeded its memory ceiling";
    case E::HOST_FUNCTION_FAILURE:
      return "Host function failed";
    case E::IO_LIMIT:
      return "Capsule input or output exceeds the size limit";
  }
  return "Unknown execution error";
}
