/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "common/buffer_view.hpp"
#include "outcome/outcome.hpp"

namespace sealbox::common {

  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
  };

  /// Lowercase hex of the bytes, no prefix
  std::string hex_lower(BufferView bytes);

  /// Lowercase hex of the bytes with the 0x prefix
  std::string hex_lower_0x(BufferView bytes);

  /**
   * Decodes a hex string, upper and lower case digits are accepted
   * @return NOT_ENOUGH_INPUT for an odd number of digits, NON_HEX_INPUT for
   * any other character
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /// Same as unhex, but requires and strips the 0x prefix
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace sealbox::common

OUTCOME_HPP_DECLARE_ERROR(sealbox::common, UnhexError);
