/**
 * @file site.hpp
 * @brief Observing site model: geolocation, local horizon profile and site-level transforms.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "obsplan/core/transforms.hpp"
#include "obsplan/core/types.hpp"

namespace obsplan::site {

/**
 * @brief One vertex of a local horizon profile.
 */
struct HorizonPoint {
  double az_deg{};
  double alt_deg{};
};

/**
 * @brief Azimuth to minimum-altitude function, piecewise linear with wrap-around at 360 deg.
 *
 * An empty profile is a flat 0 deg horizon.
 */
class HorizonProfile {
 public:
  HorizonProfile() = default;

  /**
   * @brief Build a profile from unordered points; fails on non-finite values or altitudes outside [-90, 90].
   */
  static std::optional<HorizonProfile> FromPoints(std::vector<HorizonPoint> points);

  /**
   * @brief Parse `az:alt;az:alt;...` text.
   */
  static std::optional<HorizonProfile> Parse(const std::string& text);

  /**
   * @brief Minimum altitude (deg) at an azimuth (deg, any range).
   */
  [[nodiscard]] double min_altitude_deg(double az_deg) const;

  /**
   * @brief Highest vertex altitude, 0 for a flat profile.
   */
  [[nodiscard]] double max_altitude_deg() const;

  [[nodiscard]] bool empty() const { return points_.empty(); }
  [[nodiscard]] const std::vector<HorizonPoint>& points() const { return points_; }

 private:
  explicit HorizonProfile(std::vector<HorizonPoint> points) : points_(std::move(points)) {}

  std::vector<HorizonPoint> points_{};
};

/**
 * @brief Observing site. Immutable once loaded; shared by all computations referencing it.
 */
struct Site {
  std::string id{};
  std::string name{};
  core::GeodeticPoint location{};
  double timezone_hours{};
  HorizonProfile horizon{};
  core::RefractionModel refraction{};
  double dut1_s{};
};

/**
 * @brief Validate geolocation and site metadata; returns `Status::InvalidSite` when malformed.
 */
[[nodiscard]] core::Status validate_site(const Site& site);

/**
 * @brief Angle result in degrees with status.
 */
struct AngleResult {
  double deg{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Apparent local sidereal time at the site.
 */
[[nodiscard]] AngleResult local_sidereal_time(const Site& site, const core::Epoch& t);

/**
 * @brief Frame state at `t` for the site's UT1 offset; `status` carries `InvalidTime` for unsupported epochs.
 */
struct FrameResult {
  core::FrameState frame{};
  core::Status status{core::Status::Ok};
};
[[nodiscard]] FrameResult frame_state(const Site& site, const core::Epoch& t);

/**
 * @brief Mean J2000 RA/Dec to observed altitude/azimuth at the site.
 *
 * Fails with `InvalidSite`, `InvalidTime` or `InvalidTarget` (non-finite or out-of-range coordinates).
 */
[[nodiscard]] core::HorizontalResult equatorial_to_horizontal(const Site& site,
                                                              const core::Epoch& t,
                                                              const core::Equatorial& radec);

/**
 * @brief Inverse of `equatorial_to_horizontal` at the same site and epoch.
 */
[[nodiscard]] core::EquatorialResult horizontal_to_equatorial(const Site& site,
                                                              const core::Epoch& t,
                                                              const core::Horizontal& altaz);

/**
 * @brief ISO-8601 text of `t` in the site's local time zone.
 */
[[nodiscard]] std::string local_time_iso(const Site& site, const core::Epoch& t);

/**
 * @brief Check RA/Dec ranges; used by the transform entry points and target validation.
 */
[[nodiscard]] bool valid_radec(const core::Equatorial& radec);

}  // namespace obsplan::site
