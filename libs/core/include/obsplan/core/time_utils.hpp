/**
 * @file time_utils.hpp
 * @brief UTC epoch conversions: Julian dates, time scales, civil calendar and ISO-8601 text.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "obsplan/core/constants.hpp"
#include "obsplan/core/leap_seconds.hpp"
#include "obsplan/core/types.hpp"

namespace obsplan::core {

/**
 * @brief Broken-down UTC calendar time.
 */
struct CivilTime {
  int year{1970};
  unsigned month{1};
  unsigned day{1};
  int hour{};
  int minute{};
  double second{};
};

inline std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline CivilTime civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilTime{.year = static_cast<int>(y + (m <= 2)), .month = m, .day = d};
}

inline double civil_to_utc_seconds(const CivilTime& c) {
  return static_cast<double>(days_from_civil(c.year, c.month, c.day)) * constants::kSecondsPerDay
         + c.hour * 3600.0 + c.minute * 60.0 + c.second;
}

inline CivilTime utc_seconds_to_civil(double utc_seconds) {
  const double days = std::floor(utc_seconds / constants::kSecondsPerDay);
  double sod = utc_seconds - days * constants::kSecondsPerDay;
  CivilTime c = civil_from_days(static_cast<std::int64_t>(days));
  c.hour = static_cast<int>(sod / 3600.0);
  sod -= c.hour * 3600.0;
  c.minute = static_cast<int>(sod / 60.0);
  c.second = sod - c.minute * 60.0;
  return c;
}

/**
 * @brief Check an epoch against the supported ephemeris validity range.
 */
inline Status validate_epoch(double utc_seconds) {
  if (!std::isfinite(utc_seconds) || utc_seconds < constants::kMinSupportedUtcSeconds
      || utc_seconds > constants::kMaxSupportedUtcSeconds) {
    return Status::InvalidTime;
  }
  return Status::Ok;
}

inline double utc_seconds_to_julian_date_utc(double utc_seconds) {
  return utc_seconds / constants::kSecondsPerDay + constants::kUnixEpochJd;
}

inline double julian_date_utc_to_utc_seconds(double jd_utc) {
  return (jd_utc - constants::kUnixEpochJd) * constants::kSecondsPerDay;
}

inline double tt_minus_utc_seconds(double utc_seconds) {
  return leap_seconds::tai_minus_utc_seconds(utc_seconds) + constants::kTtMinusTaiSeconds;
}

inline double utc_seconds_to_julian_date_tt(double utc_seconds) {
  return utc_seconds_to_julian_date_utc(utc_seconds) + tt_minus_utc_seconds(utc_seconds) / constants::kSecondsPerDay;
}

/**
 * @brief Julian year (e.g. 2000.0 for J2000) of a UTC epoch, for proper-motion propagation.
 */
inline double utc_seconds_to_julian_year(double utc_seconds) {
  return 2000.0 + (utc_seconds_to_julian_date_tt(utc_seconds) - constants::kJ2000Jd) / constants::kDaysPerJulianYear;
}

/**
 * @brief Format an epoch as ISO-8601 UTC with a trailing `Z`; `offset_hours` shifts to local time
 * and prints the offset instead.
 */
inline std::string format_iso8601(double utc_seconds, double offset_hours = 0.0) {
  const double shifted = std::round(utc_seconds + offset_hours * 3600.0);
  const CivilTime c = utc_seconds_to_civil(shifted);
  const std::string stamp = fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}", c.year, c.month, c.day, c.hour,
                                        c.minute, static_cast<int>(c.second));
  if (offset_hours == 0.0) {
    return stamp + "Z";
  }
  const int total_min = static_cast<int>(std::lround(std::abs(offset_hours) * 60.0));
  return fmt::format("{}{}{:02d}:{:02d}", stamp, offset_hours < 0.0 ? '-' : '+', total_min / 60, total_min % 60);
}

/**
 * @brief Parse `YYYY-MM-DD[THH:MM[:SS[.fff]]][Z|±HH:MM]` into UTC seconds.
 */
inline std::optional<double> parse_iso8601(std::string_view text) {
  auto digits = [&text](std::size_t pos, std::size_t n, int& out) {
    if (pos + n > text.size()) {
      return false;
    }
    int v = 0;
    for (std::size_t i = pos; i < pos + n; ++i) {
      if (text[i] < '0' || text[i] > '9') {
        return false;
      }
      v = v * 10 + (text[i] - '0');
    }
    out = v;
    return true;
  };

  CivilTime c{};
  int month = 0;
  int day = 0;
  if (!digits(0, 4, c.year) || text.size() < 10 || text[4] != '-' || text[7] != '-' || !digits(5, 2, month)
      || !digits(8, 2, day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return std::nullopt;
  }
  c.month = static_cast<unsigned>(month);
  c.day = static_cast<unsigned>(day);

  std::size_t pos = 10;
  if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
    if (!digits(pos + 1, 2, c.hour) || pos + 3 >= text.size() || text[pos + 3] != ':' || !digits(pos + 4, 2, c.minute)) {
      return std::nullopt;
    }
    pos += 6;
    if (pos < text.size() && text[pos] == ':') {
      int sec = 0;
      if (!digits(pos + 1, 2, sec)) {
        return std::nullopt;
      }
      c.second = sec;
      pos += 3;
      if (pos < text.size() && text[pos] == '.') {
        double scale = 0.1;
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
          c.second += scale * (text[pos] - '0');
          scale *= 0.1;
          ++pos;
        }
      }
    }
    if (c.hour > 23 || c.minute > 59 || c.second >= 61.0) {
      return std::nullopt;
    }
  }

  double offset_s = 0.0;
  if (pos < text.size()) {
    if (text[pos] == 'Z') {
      ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
      int oh = 0;
      int om = 0;
      if (!digits(pos + 1, 2, oh) || pos + 3 >= text.size() || text[pos + 3] != ':' || !digits(pos + 4, 2, om)) {
        return std::nullopt;
      }
      offset_s = (text[pos] == '-' ? -1.0 : 1.0) * (oh * 3600.0 + om * 60.0);
      pos += 6;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }
  return civil_to_utc_seconds(c) - offset_s;
}

}  // namespace obsplan::core
