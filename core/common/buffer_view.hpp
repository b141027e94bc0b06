/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string_view>

inline auto operator""_bytes(const char *s, std::size_t size) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(s), size);
}

namespace sealbox::common {

  using BufferView = std::span<const uint8_t>;

  inline std::string_view asString(BufferView view) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const char *>(view.data()), view.size()};
  }

}  // namespace sealbox::common
