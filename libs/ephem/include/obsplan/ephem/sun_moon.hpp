/**
 * @file sun_moon.hpp
 * @brief Low-precision analytic Sun and Moon ephemerides with topocentric reduction.
 * @author Watosn
 */
#pragma once

#include "obsplan/core/transforms.hpp"
#include "obsplan/core/types.hpp"
#include "obsplan/site/site.hpp"

namespace obsplan::ephem {

/**
 * @brief Geocentric apparent position of a body, true equator and equinox of date.
 */
struct GeocentricBody {
  core::Vec3 position_km{};
  double distance_km{};
};

/**
 * @brief Apparent geocentric Sun (precision ~0.01 deg).
 */
[[nodiscard]] GeocentricBody sun_geocentric(const core::FrameState& fs);

/**
 * @brief Apparent geocentric Moon from the leading terms of the ELP-2000/82 series (precision ~0.01 deg).
 */
[[nodiscard]] GeocentricBody moon_geocentric(const core::FrameState& fs);

/**
 * @brief Observer position (km) in the true-of-date equatorial frame at the given local sidereal time.
 */
[[nodiscard]] core::Vec3 observer_geocentric_km(const core::GeodeticPoint& observer, double lst_rad);

/**
 * @brief Target-independent Sun/Moon state as seen from one site at one epoch.
 *
 * Directions are topocentric unit vectors in the true-of-date equatorial frame.
 */
struct SunMoonState {
  core::Vec3 sun_dir{};
  core::Vec3 moon_dir{};
  double moon_distance_km{};
  double moon_illuminated_fraction{};
};

[[nodiscard]] SunMoonState sun_moon_state(const core::FrameState& fs, const core::GeodeticPoint& observer);

/**
 * @brief Fraction of the lunar disk illuminated, from geocentric Sun and Moon positions.
 */
[[nodiscard]] double moon_illuminated_fraction(const GeocentricBody& sun, const GeocentricBody& moon);

/**
 * @brief Altitude/azimuth of a true-of-date direction at a local sidereal time.
 */
[[nodiscard]] core::Horizontal direction_to_horizontal(const core::Vec3& dir_of_date,
                                                       double lst_rad,
                                                       const core::GeodeticPoint& observer);

struct SunResult {
  core::Horizontal position{};
  core::Status status{core::Status::Ok};
};

struct MoonResult {
  core::Horizontal position{};
  double illuminated_fraction{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Sun altitude/azimuth at a site.
 */
[[nodiscard]] SunResult sun_position(const site::Site& site, const core::Epoch& t);

/**
 * @brief Moon altitude/azimuth and illuminated fraction at a site.
 */
[[nodiscard]] MoonResult moon_position(const site::Site& site, const core::Epoch& t);

}  // namespace obsplan::ephem
