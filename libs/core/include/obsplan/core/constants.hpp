/**
 * @file constants.hpp
 * @brief Shared astronomical constants.
 * @author Watosn
 */
#pragma once

namespace obsplan::core::constants {

inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kTwoPi = 2.0 * kPi;
inline constexpr double kDegToRad = kPi / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPi;
inline constexpr double kArcsecToRad = kDegToRad / 3600.0;

inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kDaysPerJulianCentury = 36525.0;
inline constexpr double kDaysPerJulianYear = 365.25;
inline constexpr double kJ2000Jd = 2451545.0;
inline constexpr double kUnixEpochJd = 2440587.5;
inline constexpr double kTtMinusTaiSeconds = 32.184;

inline constexpr double kEarthRadiusWgs84M = 6378137.0;
inline constexpr double kEarthFlatteningWgs84 = 1.0 / 298.257223563;
inline constexpr double kAstronomicalUnitM = 149597870700.0;

// Supported ephemeris validity range, 1900-01-01T00:00:00Z .. 2100-01-01T00:00:00Z.
inline constexpr double kMinSupportedUtcSeconds = -2208988800.0;
inline constexpr double kMaxSupportedUtcSeconds = 4102444800.0;

}  // namespace obsplan::core::constants
