/**
 * @file angles.hpp
 * @brief Sexagesimal coordinate text parsing and formatting.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace obsplan::core::angles {

namespace detail {

inline std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

inline std::optional<double> to_double(std::string_view s) {
  if (s.empty()) {
    return std::nullopt;
  }
  const std::string buf(s);
  char* end = nullptr;
  const double v = std::strtod(buf.c_str(), &end);
  if (end == buf.c_str() || *end != '\0' || !std::isfinite(v)) {
    return std::nullopt;
  }
  return v;
}

// Splits "a:b:c" (or "a b c") into one to three unsigned components; returns a + b/60 + c/3600.
inline std::optional<double> parse_fields(std::string_view s) {
  double parts[3] = {0.0, 0.0, 0.0};
  int n = 0;
  std::size_t pos = 0;
  while (pos < s.size()) {
    const std::size_t stop = std::min(s.find_first_of(": ", pos), s.size());
    if (stop > pos) {
      if (n == 3) {
        return std::nullopt;
      }
      const auto v = to_double(s.substr(pos, stop - pos));
      if (!v || *v < 0.0) {
        return std::nullopt;
      }
      parts[n++] = *v;
    }
    pos = stop + 1;
  }
  if (n == 0 || parts[1] >= 60.0 || parts[2] >= 60.0) {
    return std::nullopt;
  }
  return parts[0] + parts[1] / 60.0 + parts[2] / 3600.0;
}

// True when the integer part is long enough to be the compact DDMMSS form.
inline bool is_compact(std::string_view s) {
  return std::min(s.find('.'), s.size()) >= 6;
}

// Compact "DDMMSS.s" form: two leading unit digits, two minute digits, then seconds.
inline std::optional<double> parse_compact(std::string_view s) {
  if (s.size() < 6) {
    return std::nullopt;
  }
  const auto d = to_double(s.substr(0, 2));
  const auto m = to_double(s.substr(2, 2));
  const auto sec = to_double(s.substr(4));
  if (!d || !m || !sec || *m >= 60.0 || *sec >= 60.0) {
    return std::nullopt;
  }
  return *d + *m / 60.0 + *sec / 3600.0;
}

}  // namespace detail

/**
 * @brief Parse right ascension in degrees from `hh:mm:ss.s`, `hh mm ss.s`, compact `hhmmss.s`,
 * or plain decimal degrees.
 */
inline std::optional<double> parse_ra_deg(std::string_view text) {
  const std::string_view s = detail::trim(text);
  std::optional<double> hours{};
  if (s.find_first_of(": ") != std::string_view::npos) {
    hours = detail::parse_fields(s);
  } else if (!detail::is_compact(s)) {
    const auto deg = detail::to_double(s);
    if (!deg || *deg < 0.0 || *deg >= 360.0) {
      return std::nullopt;
    }
    return *deg;
  } else {
    hours = detail::parse_compact(s);
  }
  if (!hours || *hours >= 24.0) {
    return std::nullopt;
  }
  return *hours * 15.0;
}

/**
 * @brief Parse declination in degrees from `±dd:mm:ss.s`, `±dd mm ss.s`, compact `±ddmmss.s`,
 * or plain decimal degrees.
 */
inline std::optional<double> parse_dec_deg(std::string_view text) {
  std::string_view s = detail::trim(text);
  double sign = 1.0;
  if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
    sign = (s.front() == '-') ? -1.0 : 1.0;
    s.remove_prefix(1);
  }
  std::optional<double> deg{};
  if (s.find_first_of(": ") != std::string_view::npos) {
    deg = detail::parse_fields(s);
  } else if (!detail::is_compact(s)) {
    deg = detail::to_double(s);
  } else {
    deg = detail::parse_compact(s);
  }
  if (!deg || *deg > 90.0) {
    return std::nullopt;
  }
  return sign * *deg;
}

/**
 * @brief Format right ascension (degrees) as `hh:mm:ss.sss`.
 */
inline std::string format_ra(double ra_deg) {
  double ms = std::round(std::fmod(ra_deg / 15.0 + 24.0, 24.0) * 3600.0 * 1000.0);
  ms = std::fmod(ms, 24.0 * 3600.0 * 1000.0);
  const long long total = static_cast<long long>(ms);
  return fmt::format("{:02d}:{:02d}:{:06.3f}", total / 3600000, (total / 60000) % 60, (total % 60000) / 1000.0);
}

/**
 * @brief Format declination (degrees) as `±dd:mm:ss.ss`.
 */
inline std::string format_dec(double dec_deg) {
  const long long total = static_cast<long long>(std::round(std::abs(dec_deg) * 3600.0 * 100.0));
  return fmt::format("{}{:02d}:{:02d}:{:05.2f}", dec_deg < 0.0 ? '-' : '+', total / 360000, (total / 6000) % 60,
                     (total % 6000) / 100.0);
}

}  // namespace obsplan::core::angles
