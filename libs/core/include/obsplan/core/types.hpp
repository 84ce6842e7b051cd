/**
 * @file types.hpp
 * @brief Core domain types for obsplan.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <string_view>

namespace obsplan::core {

/**
 * @brief Standard status code used by engine outputs.
 *
 * A legitimate zero-window outcome is reported as `Ok` with an empty result, never as an error.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidInput,
  InvalidTime,
  InvalidSite,
  InvalidTarget,
  NumericNonConvergence,
  Cancelled,
  DataUnavailable,
};

inline std::string_view to_string(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::InvalidTime:
      return "invalid_time";
    case Status::InvalidSite:
      return "invalid_site";
    case Status::InvalidTarget:
      return "invalid_target";
    case Status::NumericNonConvergence:
      return "numeric_non_convergence";
    case Status::Cancelled:
      return "cancelled";
    case Status::DataUnavailable:
      return "data_unavailable";
  }
  return "unknown";
}

/**
 * @brief Cartesian 3-vector.
 */
struct Vec3 {
  double x{};
  double y{};
  double z{};
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return Vec3{a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return Vec3{a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator*(double s, const Vec3& v) { return Vec3{s * v.x, s * v.y, s * v.z}; }
inline Vec3 operator*(const Vec3& v, double s) { return s * v; }
inline Vec3 operator/(const Vec3& v, double s) { return Vec3{v.x / s, v.y / s, v.z / s}; }

inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline double norm(const Vec3& v) { return std::sqrt(dot(v, v)); }

inline Vec3 normalized(const Vec3& v) {
  const double n = norm(v);
  return (n > 0.0) ? v / n : Vec3{};
}

/**
 * @brief UTC epoch expressed as seconds since Unix epoch.
 */
struct Epoch {
  double utc_seconds{};
};

/**
 * @brief Geodetic point of an observer.
 */
struct GeodeticPoint {
  double lat_deg{};
  double lon_deg{};
  double alt_m{};
};

/**
 * @brief Equatorial (RA/Dec) direction in degrees.
 */
struct Equatorial {
  double ra_deg{};
  double dec_deg{};
};

/**
 * @brief Horizontal (altitude/azimuth) direction in degrees, azimuth from north through east.
 */
struct Horizontal {
  double alt_deg{};
  double az_deg{};
};

/**
 * @brief Time scale tag carried by time ranges.
 *
 * The engine runs in UTC only; site-local time is a presentation concern.
 */
enum class TimeScale : std::uint8_t { UTC };

/**
 * @brief Time range with a sampling step.
 */
struct TimeSpec {
  Epoch start{};
  Epoch end{};
  double step_s{300.0};
  TimeScale scale{TimeScale::UTC};

  [[nodiscard]] double duration_s() const { return end.utc_seconds - start.utc_seconds; }
  [[nodiscard]] bool contains(double utc_seconds) const {
    return utc_seconds >= start.utc_seconds && utc_seconds <= end.utc_seconds;
  }
};

}  // namespace obsplan::core
