/**
 * @file transforms.hpp
 * @brief Apparent-place and equatorial/horizontal transform helpers.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

#include "obsplan/core/constants.hpp"
#include "obsplan/core/math_utils.hpp"
#include "obsplan/core/sofa_utils.hpp"
#include "obsplan/core/time_utils.hpp"
#include "obsplan/core/types.hpp"

namespace obsplan::core {

/**
 * @brief Target-independent frame state at one epoch.
 *
 * Holds everything needed to turn a mean J2000 place into an apparent place and a sidereal
 * angle; built once per epoch and reused for every target evaluated at that epoch.
 */
struct FrameState {
  double utc_seconds{};
  double jd_utc{};
  double jd_tt{};
  double gmst_rad{};
  double gast_rad{};
  double eps_true_rad{};
  double dpsi_rad{};
  Mat3 npb{mat_identity()};
  Mat3 npb_t{mat_identity()};
  Vec3 earth_velocity_c{};
};

/**
 * @brief Atmospheric refraction settings applied uniformly to every altitude.
 */
struct RefractionModel {
  bool enabled{false};
  double pressure_hpa{1010.0};
  double temperature_c{10.0};
};

/**
 * @brief Altitude/azimuth evaluation with status.
 */
struct HorizontalResult {
  Horizontal position{};
  double hour_angle_deg{};
  Status status{Status::Ok};
};

/**
 * @brief RA/Dec evaluation with status.
 */
struct EquatorialResult {
  Equatorial position{};
  Status status{Status::Ok};
};

/**
 * @brief Geometric ecliptic longitude of the Sun (radians), low precision (0.01 deg).
 */
inline double sun_true_longitude_rad(double jd_tt) {
  const double t = (jd_tt - constants::kJ2000Jd) / constants::kDaysPerJulianCentury;
  const double l0 = 280.46646 + 36000.76983 * t + 0.0003032 * t * t;
  const double m = (357.52911 + 35999.05029 * t - 0.0001537 * t * t) * constants::kDegToRad;
  const double c = (1.914602 - 0.004817 * t - 0.000014 * t * t) * std::sin(m) + (0.019993 - 0.000101 * t) * std::sin(2.0 * m)
                   + 0.000289 * std::sin(3.0 * m);
  return wrap_two_pi((l0 + c) * constants::kDegToRad);
}

/**
 * @brief Earth's barycentric velocity in units of c, J2000 equatorial axes (circular-orbit approximation).
 */
inline Vec3 earth_velocity_over_c(double jd_tt) {
  constexpr double kAberrationConstantRad = 20.49552 * constants::kArcsecToRad;
  const double lambda = sun_true_longitude_rad(jd_tt);
  const double eps = sofa::obl80(constants::kJ2000Jd);
  return kAberrationConstantRad * Vec3{std::sin(lambda), -std::cos(lambda) * std::cos(eps), -std::cos(lambda) * std::sin(eps)};
}

/**
 * @brief Build the frame state for a UTC epoch. UT1 is taken as UTC + `dut1_s`.
 */
inline FrameState build_frame_state(double utc_seconds, double dut1_s = 0.0) {
  FrameState fs{};
  fs.utc_seconds = utc_seconds;
  fs.jd_utc = utc_seconds_to_julian_date_utc(utc_seconds);
  fs.jd_tt = utc_seconds_to_julian_date_tt(utc_seconds);
  const double eps_mean = sofa::obl80(fs.jd_tt);
  const sofa::Nutation nut = sofa::nut80(fs.jd_tt);
  fs.eps_true_rad = eps_mean + nut.deps_rad;
  fs.dpsi_rad = nut.dpsi_rad;
  fs.gmst_rad = sofa::gmst82(fs.jd_utc + dut1_s / constants::kSecondsPerDay);
  fs.gast_rad = wrap_two_pi(fs.gmst_rad + sofa::eqeq(eps_mean, nut));
  fs.npb = mat_mul(sofa::numat(eps_mean, nut), sofa::pmat76(fs.jd_tt));
  fs.npb_t = mat_transpose(fs.npb);
  fs.earth_velocity_c = earth_velocity_over_c(fs.jd_tt);
  return fs;
}

/**
 * @brief Apparent local sidereal time (radians) for an east-positive longitude.
 */
inline double local_sidereal_time_rad(const FrameState& fs, double lon_deg) {
  return wrap_two_pi(fs.gast_rad + lon_deg * constants::kDegToRad);
}

/**
 * @brief Mean J2000 direction to apparent direction (true equator and equinox of date, aberrated).
 */
inline Vec3 apparent_direction(const FrameState& fs, const Vec3& mean_j2000) {
  const Vec3 aberrated = normalized(mean_j2000 + fs.earth_velocity_c);
  return mat_vec(fs.npb, aberrated);
}

/**
 * @brief Inverse of `apparent_direction`.
 */
inline Vec3 mean_direction(const FrameState& fs, const Vec3& apparent) {
  const Vec3 aberrated = mat_vec(fs.npb_t, apparent);
  // p' = (p + v) / |p + v|; two fixed-point passes recover p to well below 1e-12 rad.
  Vec3 p = normalized(aberrated - fs.earth_velocity_c);
  for (int i = 0; i < 2; ++i) {
    const double scale = norm(p + fs.earth_velocity_c);
    p = normalized(scale * aberrated - fs.earth_velocity_c);
  }
  return p;
}

/**
 * @brief Refraction (degrees) to add to a true altitude (Saemundsson).
 */
inline double refraction_deg(double true_alt_deg, const RefractionModel& model) {
  if (!model.enabled || true_alt_deg < -1.0) {
    return 0.0;
  }
  const double h = std::max(true_alt_deg, -1.0);
  const double r_arcmin = 1.02 / std::tan((h + 10.3 / (h + 5.11)) * constants::kDegToRad);
  const double scale = (model.pressure_hpa / 1010.0) * (283.0 / (273.0 + model.temperature_c));
  return std::max(0.0, r_arcmin * scale / 60.0);
}

/**
 * @brief True altitude for an observed (refracted) altitude; inverts `refraction_deg` iteratively.
 */
inline double unrefracted_altitude_deg(double apparent_alt_deg, const RefractionModel& model) {
  if (!model.enabled) {
    return apparent_alt_deg;
  }
  double h = apparent_alt_deg;
  for (int i = 0; i < 8; ++i) {
    h = apparent_alt_deg - refraction_deg(h, model);
  }
  return h;
}

/**
 * @brief Hour angle/declination to horizontal for a geodetic latitude (all radians in, degrees out).
 */
inline Horizontal hadec_to_horizontal(double ha_rad, double dec_rad, double lat_rad) {
  const double sh = std::sin(ha_rad);
  const double ch = std::cos(ha_rad);
  const double sd = std::sin(dec_rad);
  const double cd = std::cos(dec_rad);
  const double sp = std::sin(lat_rad);
  const double cp = std::cos(lat_rad);
  const double x = -ch * cd * sp + sd * cp;
  const double y = -sh * cd;
  const double z = ch * cd * cp + sd * sp;
  const double r = std::hypot(x, y);
  const double az = (r != 0.0) ? wrap_two_pi(std::atan2(y, x)) : 0.0;
  return Horizontal{.alt_deg = std::atan2(z, r) * constants::kRadToDeg, .az_deg = az * constants::kRadToDeg};
}

/**
 * @brief Horizontal to hour angle/declination (radians) for a geodetic latitude.
 */
inline std::array<double, 2> horizontal_to_hadec(double alt_rad, double az_rad, double lat_rad) {
  const double sa = std::sin(az_rad);
  const double ca = std::cos(az_rad);
  const double se = std::sin(alt_rad);
  const double ce = std::cos(alt_rad);
  const double sp = std::sin(lat_rad);
  const double cp = std::cos(lat_rad);
  const double x = -ca * ce * sp + se * cp;
  const double y = -sa * ce;
  const double z = ca * ce * cp + se * sp;
  const double r = std::hypot(x, y);
  const double ha = (r != 0.0) ? std::atan2(y, x) : 0.0;
  return {ha, std::atan2(z, r)};
}

/**
 * @brief Apparent RA/Dec of date (radians) of a mean J2000 place.
 */
inline std::array<double, 2> apparent_radec_rad(const FrameState& fs, const Equatorial& mean_j2000) {
  const Vec3 p = unit_vector(mean_j2000.ra_deg * constants::kDegToRad, mean_j2000.dec_deg * constants::kDegToRad);
  return spherical_angles(apparent_direction(fs, p));
}

/**
 * @brief Mean J2000 RA/Dec to observed altitude/azimuth.
 */
inline HorizontalResult equatorial_to_horizontal(const FrameState& fs,
                                                 const GeodeticPoint& observer,
                                                 const Equatorial& mean_j2000,
                                                 const RefractionModel& refraction = {}) {
  const auto app = apparent_radec_rad(fs, mean_j2000);
  const double ha = local_sidereal_time_rad(fs, observer.lon_deg) - app[0];
  Horizontal h = hadec_to_horizontal(ha, app[1], observer.lat_deg * constants::kDegToRad);
  h.alt_deg += refraction_deg(h.alt_deg, refraction);
  return HorizontalResult{.position = h, .hour_angle_deg = wrap_180(ha * constants::kRadToDeg), .status = Status::Ok};
}

/**
 * @brief Observed altitude/azimuth back to mean J2000 RA/Dec; inverse of `equatorial_to_horizontal`.
 */
inline EquatorialResult horizontal_to_equatorial(const FrameState& fs,
                                                 const GeodeticPoint& observer,
                                                 const Horizontal& observed,
                                                 const RefractionModel& refraction = {}) {
  const double true_alt = unrefracted_altitude_deg(observed.alt_deg, refraction);
  const auto hadec = horizontal_to_hadec(true_alt * constants::kDegToRad, observed.az_deg * constants::kDegToRad,
                                         observer.lat_deg * constants::kDegToRad);
  const double ra_app = local_sidereal_time_rad(fs, observer.lon_deg) - hadec[0];
  const Vec3 mean = mean_direction(fs, unit_vector(ra_app, hadec[1]));
  const auto ang = spherical_angles(mean);
  return EquatorialResult{
      .position = Equatorial{.ra_deg = ang[0] * constants::kRadToDeg, .dec_deg = ang[1] * constants::kRadToDeg},
      .status = Status::Ok};
}

/**
 * @brief Relative airmass for an altitude (Pickering 2002); infinite at or below the horizon.
 */
inline double airmass(double alt_deg) {
  if (alt_deg <= 0.0) {
    return std::numeric_limits<double>::infinity();
  }
  const double h = alt_deg;
  return 1.0 / std::sin((h + 244.0 / (165.0 + 47.0 * std::pow(h, 1.1))) * constants::kDegToRad);
}

/**
 * @brief Altitude (deg) at which `airmass()` reaches `x`; inverse by bisection, `x` >= 1.
 */
inline double altitude_for_airmass(double x) {
  if (x <= 1.0) {
    return 90.0;
  }
  double lo = 0.0;
  double hi = 90.0;
  for (int i = 0; i < 60; ++i) {
    const double mid = 0.5 * (lo + hi);
    if (airmass(mid) > x) {
      lo = mid;
    } else {
      hi = mid;
    }
  }
  return 0.5 * (lo + hi);
}

/**
 * @brief Parallactic angle (deg) for an hour angle/declination at a latitude.
 */
inline double parallactic_angle_deg(double ha_deg, double dec_deg, double lat_deg) {
  const double ha = ha_deg * constants::kDegToRad;
  const double dec = dec_deg * constants::kDegToRad;
  const double lat = lat_deg * constants::kDegToRad;
  return std::atan2(std::sin(ha), std::tan(lat) * std::cos(dec) - std::sin(dec) * std::cos(ha)) * constants::kRadToDeg;
}

}  // namespace obsplan::core
