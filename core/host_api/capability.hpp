/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace sealbox::host_api {

  /**
   * Named permission that unlocks a fixed group of host functions
   */
  enum class Capability : uint8_t {
    Hash,
    Json,
    Base64,
    Time,
    Random,
  };

  inline constexpr std::initializer_list<Capability> kAllCapabilities{
      Capability::Hash,
      Capability::Json,
      Capability::Base64,
      Capability::Time,
      Capability::Random,
  };

  /// Stable lowercase name used in configuration files and logs
  std::string_view capabilityName(Capability capability);

  std::string_view capabilityDescription(Capability capability);

  std::optional<Capability> capabilityFromName(std::string_view name);

  /**
   * Set of granted capabilities. Iteration order is the declaration order of
   * Capability, independent of insertion order.
   */
  class CapabilitySet {
   public:
    CapabilitySet() = default;

    CapabilitySet(std::initializer_list<Capability> capabilities) {
      for (auto capability : capabilities) {
        insert(capability);
      }
    }

    static CapabilitySet all() {
      return CapabilitySet{kAllCapabilities};
    }

    bool contains(Capability capability) const {
      return (bits_ & bit(capability)) != 0;
    }

    void insert(Capability capability) {
      bits_ |= bit(capability);
    }

    void erase(Capability capability) {
      bits_ &= static_cast<uint8_t>(~bit(capability));
    }

    bool empty() const {
      return bits_ == 0;
    }

    size_t size() const;

    std::vector<Capability> toVector() const;

    bool operator==(const CapabilitySet &) const = default;

   private:
    static constexpr uint8_t bit(Capability capability) {
      return static_cast<uint8_t>(1u << static_cast<uint8_t>(capability));
    }

    uint8_t bits_ = 0;
  };

}  // namespace sealbox::host_api

template <>
struct fmt::formatter<sealbox::host_api::Capability>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(sealbox::host_api::Capability capability,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        sealbox::host_api::capabilityName(capability), ctx);
  }
};

template <>
struct fmt::formatter<sealbox::host_api::CapabilitySet>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const sealbox::host_api::CapabilitySet &set,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    auto out = ctx.out();
    *out++ = '{';
    bool first = true;
    for (auto capability : set.toVector()) {
      if (not first) {
        *out++ = ',';
      }
      first = false;
      out = fmt::format_to(
          out, "{}", sealbox::host_api::capabilityName(capability));
    }
    *out++ = '}';
    return out;
  }
};
