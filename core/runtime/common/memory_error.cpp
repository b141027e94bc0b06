/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/common/memory_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::runtime, MemoryError, e) {
  using E = sealbox::runtime::MemoryError;
  switch (e) {
    case E::OUT_OF_BOUNDS:
      return "MemoryError: Memory access out of bounds";
    case E::GROW_FAILED:
      return "MemoryError: Linear memory can not grow to the requested size";
  }
  return "MemoryError: unknown";
}
