/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/validation_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::runtime, ValidationError, e) {
  using E = sealbox::runtime::ValidationError;
  switch (e) {
    case E::TOO_LARGE:
      return "Module exceeds the maximum module size";
    case E::MALFORMED:
      return "Module is not a valid WebAssembly binary";
    case E::MISSING_EXPORT:
      return "Module does not export `run(i32, i32) -> i32` and `memory`";
    case E::UNAUTHORIZED_IMPORT:
      return "Module imports a function outside of the granted capabilities";
    case E::START_FUNCTION:
      return "Module declares a start function";
  }
  return "Unknown validation error";
}
