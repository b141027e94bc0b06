/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/time.hpp"

#include <charconv>
#include <ctime>

#include <fmt/format.h>

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::time, TimeError, e) {
  using E = sealbox::time::TimeError;
  switch (e) {
    case E::BAD_FORMAT:
      return "Timestamp does not match YYYY-MM-DDTHH:MM:SS.mmmZ";
    case E::OUT_OF_RANGE:
      return "Timestamp component is out of range";
  }
  return "Unknown TimeError";
}

namespace sealbox::time {

  namespace {
    constexpr std::string_view kLayout = "0000-00-00T00:00:00.000Z";

    bool readNumber(std::string_view str, size_t pos, size_t len, int &out) {
      auto begin = str.data() + pos;
      auto end = begin + len;
      auto [ptr, ec] = std::from_chars(begin, end, out);
      return ec == std::errc{} and ptr == end;
    }
  }  // namespace

  std::string formatUtc(TimePoint tp) {
    using namespace std::chrono;
    auto millis = duration_cast<milliseconds>(tp.time_since_epoch());
    auto secs = floor<seconds>(millis);
    auto ms = (millis - secs).count();
    std::time_t t = secs.count();
    std::tm tm{};
    gmtime_r(&t, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900,
                       tm.tm_mon + 1,
                       tm.tm_mday,
                       tm.tm_hour,
                       tm.tm_min,
                       tm.tm_sec,
                       ms);
  }

  outcome::result<TimePoint> parseUtc(std::string_view str) {
    if (str.size() != kLayout.size()) {
      return TimeError::BAD_FORMAT;
    }
    for (size_t i = 0; i < kLayout.size(); ++i) {
      if (kLayout[i] != '0' and kLayout[i] != str[i]) {
        return TimeError::BAD_FORMAT;
      }
    }
    int year{}, month{}, day{}, hour{}, minute{}, second{}, ms{};
    if (not(readNumber(str, 0, 4, year) and readNumber(str, 5, 2, month)
            and readNumber(str, 8, 2, day) and readNumber(str, 11, 2, hour)
            and readNumber(str, 14, 2, minute)
            and readNumber(str, 17, 2, second)
            and readNumber(str, 20, 3, ms))) {
      return TimeError::BAD_FORMAT;
    }
    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{year},
                       std::chrono::month{static_cast<unsigned>(month)},
                       std::chrono::day{static_cast<unsigned>(day)}};
    if (not ymd.ok() or hour > 23 or minute > 59 or second > 59) {
      return TimeError::OUT_OF_RANGE;
    }
    return TimePoint{sys_days{ymd}} + hours{hour} + minutes{minute}
         + seconds{second} + milliseconds{ms};
  }

}  // namespace sealbox::time
