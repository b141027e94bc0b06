/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include "common/buffer_view.hpp"

namespace sealbox::common {

  /// Owned byte sequence: module code, guest input and output.
  using Buffer = std::vector<uint8_t>;

  inline Buffer toBuffer(BufferView view) {
    return Buffer{view.begin(), view.end()};
  }

}  // namespace sealbox::common
