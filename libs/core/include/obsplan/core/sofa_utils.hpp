/**
 * @file sofa_utils.hpp
 * @brief SOFA-style precession/nutation/sidereal-time building blocks (modern C++ implementation).
 * @author Watosn
 */
#pragma once

#include <array>
#include <cmath>

#include "obsplan/core/constants.hpp"
#include "obsplan/core/math_utils.hpp"

namespace obsplan::core::sofa {

inline Mat3 rot_x(const double a) {
  Mat3 m = mat_identity();
  const double c = std::cos(a);
  const double s = std::sin(a);
  m(1, 1) = c;
  m(1, 2) = s;
  m(2, 1) = -s;
  m(2, 2) = c;
  return m;
}

inline Mat3 rot_y(const double a) {
  Mat3 m = mat_identity();
  const double c = std::cos(a);
  const double s = std::sin(a);
  m(0, 0) = c;
  m(0, 2) = -s;
  m(2, 0) = s;
  m(2, 2) = c;
  return m;
}

inline Mat3 rot_z(const double a) {
  Mat3 m = mat_identity();
  const double c = std::cos(a);
  const double s = std::sin(a);
  m(0, 0) = c;
  m(0, 1) = s;
  m(1, 0) = -s;
  m(1, 1) = c;
  return m;
}

/**
 * @brief Nutation components in longitude and obliquity (radians).
 */
struct Nutation {
  double dpsi_rad{};
  double deps_rad{};
};

// SOFA iauObl80-compatible mean obliquity of the ecliptic.
inline double obl80(const double jd_tt) {
  const double t = (jd_tt - constants::kJ2000Jd) / constants::kDaysPerJulianCentury;
  return constants::kArcsecToRad * (84381.448 + (-46.8150 + (-0.00059 + 0.001813 * t) * t) * t);
}

// SOFA iauPmat76-style precession matrix from J2000 mean equator to mean equator of date.
inline Mat3 pmat76(const double jd_tt) {
  const double t = (jd_tt - constants::kJ2000Jd) / constants::kDaysPerJulianCentury;
  const double zeta = (2306.2181 + (0.30188 + 0.017998 * t) * t) * t * constants::kArcsecToRad;
  const double z = (2306.2181 + (1.09468 + 0.018203 * t) * t) * t * constants::kArcsecToRad;
  const double theta = (2004.3109 + (-0.42665 - 0.041833 * t) * t) * t * constants::kArcsecToRad;
  return mat_mul(rot_z(-z), mat_mul(rot_y(theta), rot_z(-zeta)));
}

// IAU 1980 nutation, truncated to the terms above 0.0015" (precision ~0.1").
inline Nutation nut80(const double jd_tt) {
  struct Term {
    int d;
    int m;
    int mp;
    int f;
    int om;
    double s0;
    double s1;
    double c0;
    double c1;
  };
  // Coefficients in units of 0.0001 arcsec (Meeus table 22.A).
  static constexpr std::array<Term, 31> kTerms{{
      {0, 0, 0, 0, 1, -171996.0, -174.2, 92025.0, 8.9},
      {-2, 0, 0, 2, 2, -13187.0, -1.6, 5736.0, -3.1},
      {0, 0, 0, 2, 2, -2274.0, -0.2, 977.0, -0.5},
      {0, 0, 0, 0, 2, 2062.0, 0.2, -895.0, 0.5},
      {0, 1, 0, 0, 0, 1426.0, -3.4, 54.0, -0.1},
      {0, 0, 1, 0, 0, 712.0, 0.1, -7.0, 0.0},
      {-2, 1, 0, 2, 2, -517.0, 1.2, 224.0, -0.6},
      {0, 0, 0, 2, 1, -386.0, -0.4, 200.0, 0.0},
      {0, 0, 1, 2, 2, -301.0, 0.0, 129.0, -0.1},
      {-2, -1, 0, 2, 2, 217.0, -0.5, -95.0, 0.3},
      {-2, 0, 1, 0, 0, -158.0, 0.0, 0.0, 0.0},
      {-2, 0, 0, 2, 1, 129.0, 0.1, -70.0, 0.0},
      {0, 0, -1, 2, 2, 123.0, 0.0, -53.0, 0.0},
      {2, 0, 0, 0, 0, 63.0, 0.0, 0.0, 0.0},
      {0, 0, 1, 0, 1, 63.0, 0.1, -33.0, 0.0},
      {2, 0, -1, 2, 2, -59.0, 0.0, 26.0, 0.0},
      {0, 0, -1, 0, 1, -58.0, -0.1, 32.0, 0.0},
      {0, 0, 1, 2, 1, -51.0, 0.0, 27.0, 0.0},
      {-2, 0, 2, 0, 0, 48.0, 0.0, 0.0, 0.0},
      {0, 0, -2, 2, 1, 46.0, 0.0, -24.0, 0.0},
      {2, 0, 0, 2, 2, -38.0, 0.0, 16.0, 0.0},
      {0, 0, 2, 2, 2, -31.0, 0.0, 13.0, 0.0},
      {0, 0, 2, 0, 0, 29.0, 0.0, 0.0, 0.0},
      {-2, 0, 1, 2, 2, 29.0, 0.0, -12.0, 0.0},
      {0, 0, 0, 2, 0, 26.0, 0.0, 0.0, 0.0},
      {-2, 0, 0, 2, 0, -22.0, 0.0, 0.0, 0.0},
      {0, 0, -1, 2, 1, 21.0, 0.0, -10.0, 0.0},
      {0, 2, 0, 0, 0, 17.0, -0.1, 0.0, 0.0},
      {2, 0, -1, 0, 1, 16.0, 0.0, -8.0, 0.0},
      {-2, 2, 0, 2, 2, -16.0, 0.1, 7.0, 0.0},
      {0, 1, 0, 0, 1, -15.0, 0.0, 9.0, 0.0},
  }};

  const double t = (jd_tt - constants::kJ2000Jd) / constants::kDaysPerJulianCentury;
  const double t2 = t * t;
  const double t3 = t2 * t;
  const double d = (297.85036 + 445267.111480 * t - 0.0019142 * t2 + t3 / 189474.0) * constants::kDegToRad;
  const double m = (357.52772 + 35999.050340 * t - 0.0001603 * t2 - t3 / 300000.0) * constants::kDegToRad;
  const double mp = (134.96298 + 477198.867398 * t + 0.0086972 * t2 + t3 / 56250.0) * constants::kDegToRad;
  const double f = (93.27191 + 483202.017538 * t - 0.0036825 * t2 + t3 / 327270.0) * constants::kDegToRad;
  const double om = (125.04452 - 1934.136261 * t + 0.0020708 * t2 + t3 / 450000.0) * constants::kDegToRad;

  double dpsi = 0.0;
  double deps = 0.0;
  for (const auto& term : kTerms) {
    const double arg = term.d * d + term.m * m + term.mp * mp + term.f * f + term.om * om;
    dpsi += (term.s0 + term.s1 * t) * std::sin(arg);
    deps += (term.c0 + term.c1 * t) * std::cos(arg);
  }
  constexpr double kUnit = 1.0e-4 * constants::kArcsecToRad;
  return Nutation{.dpsi_rad = dpsi * kUnit, .deps_rad = deps * kUnit};
}

// SOFA iauNumat-style nutation matrix: mean equator of date to true equator of date.
inline Mat3 numat(const double eps_mean_rad, const Nutation& nut) {
  return mat_mul(rot_x(-(eps_mean_rad + nut.deps_rad)), mat_mul(rot_z(-nut.dpsi_rad), rot_x(eps_mean_rad)));
}

// SOFA iauGmst82-style Greenwich mean sidereal time (UT1 Julian date).
inline double gmst82(const double jd_ut1) {
  const double d = jd_ut1 - constants::kJ2000Jd;
  const double t = d / constants::kDaysPerJulianCentury;
  const double gmst_deg = 280.46061837 + 360.98564736629 * d + 0.000387933 * t * t - (t * t * t) / 38710000.0;
  return wrap_two_pi(gmst_deg * constants::kDegToRad);
}

// SOFA iauEqeq94-style equation of the equinoxes (leading term).
inline double eqeq(const double eps_mean_rad, const Nutation& nut) {
  return nut.dpsi_rad * std::cos(eps_mean_rad);
}

}  // namespace obsplan::core::sofa
