/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <iterator>

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::common, UnhexError, e) {
  using sealbox::common::UnhexError;
  switch (e) {
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Hex string has an odd number of digits";
    case UnhexError::NON_HEX_INPUT:
      return "Hex string contains a non-hex character";
    case UnhexError::MISSING_0X_PREFIX:
      return "Hex string does not start with 0x";
  }
  return "Unknown unhex error";
}

namespace sealbox::common {

  std::string hex_lower(BufferView bytes) {
    std::string hex;
    hex.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(hex));
    return hex;
  }

  std::string hex_lower_0x(BufferView bytes) {
    return "0x" + hex_lower(bytes);
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(
          hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::NOT_ENOUGH_INPUT;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::NON_HEX_INPUT;
    }
    return bytes;
  }

  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex) {
    if (not hex.starts_with("0x")) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    return unhex(hex.substr(2));
  }

}  // namespace sealbox::common
