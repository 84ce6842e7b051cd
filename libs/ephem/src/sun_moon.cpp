/**
 * @file sun_moon.cpp
 * @brief Analytic Sun/Moon ephemeris implementation.
 * @author Watosn
 */

#include "obsplan/ephem/sun_moon.hpp"

#include <array>
#include <cmath>

#include "obsplan/core/constants.hpp"
#include "obsplan/core/math_utils.hpp"

namespace obsplan::ephem {
namespace {

using obsplan::core::constants::kDegToRad;

constexpr double kAuKm = obsplan::core::constants::kAstronomicalUnitM / 1000.0;

struct LonDistTerm {
  int d;
  int m;
  int mp;
  int f;
  double sl;  // 1e-6 deg
  double sr;  // 1e-3 km
};

struct LatTerm {
  int d;
  int m;
  int mp;
  int f;
  double sb;  // 1e-6 deg
};

// Leading periodic terms of the lunar longitude/distance (Meeus table 47.A).
constexpr std::array<LonDistTerm, 32> kLonDistTerms{{
    {0, 0, 1, 0, 6288774.0, -20905355.0}, {2, 0, -1, 0, 1274027.0, -3699111.0},
    {2, 0, 0, 0, 658314.0, -2955968.0},   {0, 0, 2, 0, 213618.0, -569925.0},
    {0, 1, 0, 0, -185116.0, 48888.0},     {0, 0, 0, 2, -114332.0, -3149.0},
    {2, 0, -2, 0, 58793.0, 246158.0},     {2, -1, -1, 0, 57066.0, -152138.0},
    {2, 0, 1, 0, 53322.0, -170733.0},     {2, -1, 0, 0, 45758.0, -204586.0},
    {0, 1, -1, 0, -40923.0, -129620.0},   {1, 0, 0, 0, -34720.0, 108743.0},
    {0, 1, 1, 0, -30383.0, 104755.0},     {2, 0, 0, -2, 15327.0, 10321.0},
    {0, 0, 1, 2, -12528.0, 0.0},          {0, 0, 1, -2, 10980.0, 79661.0},
    {4, 0, -1, 0, 10675.0, -34782.0},     {0, 0, 3, 0, 10034.0, -23210.0},
    {4, 0, -2, 0, 8548.0, -21636.0},      {2, 1, -1, 0, -7888.0, 24208.0},
    {2, 1, 0, 0, -6766.0, 30824.0},       {1, 0, -1, 0, -5163.0, -8379.0},
    {1, 1, 0, 0, 4987.0, -16675.0},       {2, -1, 1, 0, 4036.0, -12831.0},
    {2, 0, 2, 0, 3994.0, -10445.0},       {4, 0, 0, 0, 3861.0, -11650.0},
    {2, 0, -3, 0, 3665.0, 14403.0},       {0, 1, -2, 0, -2689.0, -7003.0},
    {2, 0, -1, 2, -2602.0, 0.0},          {2, -1, -2, 0, 2390.0, 10056.0},
    {1, 0, 1, 0, -2348.0, 6322.0},        {2, -2, 0, 0, 2236.0, -9884.0},
}};

// Leading periodic terms of the lunar latitude (Meeus table 47.B).
constexpr std::array<LatTerm, 20> kLatTerms{{
    {0, 0, 0, 1, 5128122.0}, {0, 0, 1, 1, 280602.0},  {0, 0, 1, -1, 277693.0}, {2, 0, 0, -1, 173237.0},
    {2, 0, -1, 1, 55413.0},  {2, 0, -1, -1, 46271.0}, {2, 0, 0, 1, 32573.0},   {0, 0, 2, 1, 17198.0},
    {2, 0, 1, -1, 9266.0},   {0, 0, 2, -1, 8822.0},   {2, -1, 0, -1, 8216.0},  {2, 0, -2, -1, 4324.0},
    {2, 0, 1, 1, 4200.0},    {2, 1, 0, -1, -3359.0},  {2, -1, -1, 1, 2463.0},  {2, -1, 0, 1, 2211.0},
    {2, -1, -1, -1, 2065.0}, {0, 1, -1, -1, -1870.0}, {4, 0, -1, -1, 1828.0},  {0, 1, 0, 1, -1794.0},
}};

double eccentricity_factor(int m, double e) {
  const int n = std::abs(m);
  return (n == 0) ? 1.0 : (n == 1 ? e : e * e);
}

// Ecliptic of date (longitude, latitude in radians, distance in km) to equatorial of date.
core::Vec3 ecliptic_to_equatorial(double lon, double lat, double dist_km, double eps) {
  const double cb = std::cos(lat);
  const double x = cb * std::cos(lon);
  const double y = cb * std::sin(lon);
  const double z = std::sin(lat);
  const double ce = std::cos(eps);
  const double se = std::sin(eps);
  return dist_km * core::Vec3{x, y * ce - z * se, y * se + z * ce};
}

}  // namespace

GeocentricBody sun_geocentric(const core::FrameState& fs) {
  const double t = (fs.jd_tt - core::constants::kJ2000Jd) / core::constants::kDaysPerJulianCentury;
  const double m = (357.52911 + 35999.05029 * t - 0.0001537 * t * t) * kDegToRad;
  const double e = 0.016708634 - 0.000042037 * t - 0.0000001267 * t * t;
  const double c = (1.914602 - 0.004817 * t - 0.000014 * t * t) * std::sin(m) + (0.019993 - 0.000101 * t) * std::sin(2.0 * m)
                   + 0.000289 * std::sin(3.0 * m);
  const double nu = m + c * kDegToRad;
  const double r_au = 1.000001018 * (1.0 - e * e) / (1.0 + e * std::cos(nu));
  const double aberration = -20.4898 * core::constants::kArcsecToRad / r_au;
  const double lon = core::sun_true_longitude_rad(fs.jd_tt) + fs.dpsi_rad + aberration;
  const double dist_km = r_au * kAuKm;
  return GeocentricBody{.position_km = ecliptic_to_equatorial(lon, 0.0, dist_km, fs.eps_true_rad), .distance_km = dist_km};
}

GeocentricBody moon_geocentric(const core::FrameState& fs) {
  const double t = (fs.jd_tt - core::constants::kJ2000Jd) / core::constants::kDaysPerJulianCentury;
  const double t2 = t * t;
  const double t3 = t2 * t;
  const double t4 = t3 * t;
  const double lp = core::wrap_360(218.3164477 + 481267.88123421 * t - 0.0015786 * t2 + t3 / 538841.0 - t4 / 65194000.0)
                    * kDegToRad;
  const double d = core::wrap_360(297.8501921 + 445267.1114034 * t - 0.0018819 * t2 + t3 / 545868.0 - t4 / 113065000.0)
                   * kDegToRad;
  const double m = core::wrap_360(357.5291092 + 35999.0502909 * t - 0.0001536 * t2 + t3 / 24490000.0) * kDegToRad;
  const double mp = core::wrap_360(134.9633964 + 477198.8675055 * t + 0.0087414 * t2 + t3 / 69699.0 - t4 / 14712000.0)
                    * kDegToRad;
  const double f = core::wrap_360(93.2720950 + 483202.0175233 * t - 0.0036539 * t2 - t3 / 3526000.0 + t4 / 863310000.0)
                   * kDegToRad;
  const double e = 1.0 - 0.002516 * t - 0.0000074 * t2;
  const double a1 = (119.75 + 131.849 * t) * kDegToRad;
  const double a2 = (53.09 + 479264.290 * t) * kDegToRad;
  const double a3 = (313.45 + 481266.484 * t) * kDegToRad;

  double sl = 0.0;
  double sr = 0.0;
  for (const auto& term : kLonDistTerms) {
    const double arg = term.d * d + term.m * m + term.mp * mp + term.f * f;
    const double ef = eccentricity_factor(term.m, e);
    sl += ef * term.sl * std::sin(arg);
    sr += ef * term.sr * std::cos(arg);
  }
  double sb = 0.0;
  for (const auto& term : kLatTerms) {
    const double arg = term.d * d + term.m * m + term.mp * mp + term.f * f;
    sb += eccentricity_factor(term.m, e) * term.sb * std::sin(arg);
  }
  sl += 3958.0 * std::sin(a1) + 1962.0 * std::sin(lp - f) + 318.0 * std::sin(a2);
  sb += -2235.0 * std::sin(lp) + 382.0 * std::sin(a3) + 175.0 * std::sin(a1 - f) + 175.0 * std::sin(a1 + f)
        + 127.0 * std::sin(lp - mp) - 115.0 * std::sin(lp + mp);

  const double lon = lp + sl * 1.0e-6 * kDegToRad + fs.dpsi_rad;
  const double lat = sb * 1.0e-6 * kDegToRad;
  const double dist_km = 385000.56 + sr / 1000.0;
  return GeocentricBody{.position_km = ecliptic_to_equatorial(lon, lat, dist_km, fs.eps_true_rad), .distance_km = dist_km};
}

core::Vec3 observer_geocentric_km(const core::GeodeticPoint& observer, double lst_rad) {
  const double lat = observer.lat_deg * kDegToRad;
  const double one_minus_f = 1.0 - core::constants::kEarthFlatteningWgs84;
  const double c = 1.0 / std::sqrt(std::cos(lat) * std::cos(lat) + one_minus_f * one_minus_f * std::sin(lat) * std::sin(lat));
  const double s = one_minus_f * one_minus_f * c;
  const double a_km = core::constants::kEarthRadiusWgs84M / 1000.0;
  const double h_km = observer.alt_m / 1000.0;
  const double rxy = (a_km * c + h_km) * std::cos(lat);
  return core::Vec3{rxy * std::cos(lst_rad), rxy * std::sin(lst_rad), (a_km * s + h_km) * std::sin(lat)};
}

double moon_illuminated_fraction(const GeocentricBody& sun, const GeocentricBody& moon) {
  const core::Vec3 moon_to_sun = sun.position_km - moon.position_km;
  const core::Vec3 moon_to_earth = -1.0 * moon.position_km;
  const double phase_angle = core::angle_between(moon_to_sun, moon_to_earth);
  return 0.5 * (1.0 + std::cos(phase_angle));
}

SunMoonState sun_moon_state(const core::FrameState& fs, const core::GeodeticPoint& observer) {
  const double lst = core::local_sidereal_time_rad(fs, observer.lon_deg);
  const core::Vec3 obs = observer_geocentric_km(observer, lst);
  const GeocentricBody sun = sun_geocentric(fs);
  const GeocentricBody moon = moon_geocentric(fs);
  const core::Vec3 moon_topo = moon.position_km - obs;
  return SunMoonState{
      .sun_dir = core::normalized(sun.position_km - obs),
      .moon_dir = core::normalized(moon_topo),
      .moon_distance_km = core::norm(moon_topo),
      .moon_illuminated_fraction = moon_illuminated_fraction(sun, moon),
  };
}

core::Horizontal direction_to_horizontal(const core::Vec3& dir_of_date, double lst_rad, const core::GeodeticPoint& observer) {
  const auto radec = core::spherical_angles(dir_of_date);
  return core::hadec_to_horizontal(lst_rad - radec[0], radec[1], observer.lat_deg * kDegToRad);
}

SunResult sun_position(const site::Site& site, const core::Epoch& t) {
  if (site::validate_site(site) != core::Status::Ok) {
    return SunResult{.status = core::Status::InvalidSite};
  }
  const auto fr = site::frame_state(site, t);
  if (fr.status != core::Status::Ok) {
    return SunResult{.status = fr.status};
  }
  const SunMoonState s = sun_moon_state(fr.frame, site.location);
  const double lst = core::local_sidereal_time_rad(fr.frame, site.location.lon_deg);
  core::Horizontal h = direction_to_horizontal(s.sun_dir, lst, site.location);
  h.alt_deg += core::refraction_deg(h.alt_deg, site.refraction);
  return SunResult{.position = h, .status = core::Status::Ok};
}

MoonResult moon_position(const site::Site& site, const core::Epoch& t) {
  if (site::validate_site(site) != core::Status::Ok) {
    return MoonResult{.status = core::Status::InvalidSite};
  }
  const auto fr = site::frame_state(site, t);
  if (fr.status != core::Status::Ok) {
    return MoonResult{.status = fr.status};
  }
  const SunMoonState s = sun_moon_state(fr.frame, site.location);
  const double lst = core::local_sidereal_time_rad(fr.frame, site.location.lon_deg);
  core::Horizontal h = direction_to_horizontal(s.moon_dir, lst, site.location);
  h.alt_deg += core::refraction_deg(h.alt_deg, site.refraction);
  return MoonResult{.position = h, .illuminated_fraction = s.moon_illuminated_fraction, .status = core::Status::Ok};
}

}  // namespace obsplan::ephem
