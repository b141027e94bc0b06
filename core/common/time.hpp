/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "outcome/outcome.hpp"

namespace sealbox::time {

  using TimePoint = std::chrono::system_clock::time_point;

  enum class TimeError : uint8_t { BAD_FORMAT = 1, OUT_OF_RANGE };

  /**
   * Renders UTC timestamp with millisecond precision:
   * `YYYY-MM-DDTHH:MM:SS.mmmZ`
   */
  std::string formatUtc(TimePoint tp);

  /**
   * Parses exactly the format produced by formatUtc
   */
  outcome::result<TimePoint> parseUtc(std::string_view str);

  inline uint64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
  }

}  // namespace sealbox::time

OUTCOME_HPP_DECLARE_ERROR(sealbox::time, TimeError);
