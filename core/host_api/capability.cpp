/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/capability.hpp"

#include <bit>

namespace sealbox::host_api {

  std::string_view capabilityName(Capability capability) {
    switch (capability) {
      case Capability::Hash:
        return "hash";
      case Capability::Json:
        return "json";
      case Capability::Base64:
        return "base64";
      case Capability::Time:
        return "time";
      case Capability::Random:
        return "random";
    }
    return "unknown";
  }

  std::string_view capabilityDescription(Capability capability) {
    switch (capability) {
      case Capability::Hash:
        return "SHA-256 content commitments";
      case Capability::Json:
        return "JSON path extraction";
      case Capability::Base64:
        return "Base64 encoding and decoding";
      case Capability::Time:
        return "Deterministic timestamp access";
      case Capability::Random:
        return "Deterministic random byte generation";
    }
    return "unknown";
  }

  std::optional<Capability> capabilityFromName(std::string_view name) {
    for (auto capability : kAllCapabilities) {
      if (capabilityName(capability) == name) {
        return capability;
      }
    }
    return std::nullopt;
  }

  size_t CapabilitySet::size() const {
    return std::popcount(bits_);
  }

  std::vector<Capability> CapabilitySet::toVector() const {
    std::vector<Capability> result;
    for (auto capability : kAllCapabilities) {
      if (contains(capability)) {
        result.push_back(capability);
      }
    }
    return result;
  }

}  // namespace sealbox::host_api
