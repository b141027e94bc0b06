/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "host_api/capability.hpp"

namespace sealbox::host_api {

  struct AccessRecord {
    Capability capability;
    std::string function;
    uint32_t sequence;

    bool operator==(const AccessRecord &) const = default;
  };

  /**
   * Append-only record of host function calls made during one execution.
   * Telemetry only, authorization happens when imports are bound.
   */
  class AccessLog {
   public:
    void append(Capability capability, std::string_view function) {
      records_.push_back(AccessRecord{
          capability,
          std::string{function},
          static_cast<uint32_t>(records_.size()),
      });
    }

    const std::vector<AccessRecord> &records() const {
      return records_;
    }

    size_t size() const {
      return records_.size();
    }

   private:
    std::vector<AccessRecord> records_;
  };

}  // namespace sealbox::host_api
