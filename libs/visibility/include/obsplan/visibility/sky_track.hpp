/**
 * @file sky_track.hpp
 * @brief Sampled altitude/azimuth tracks of a target for plotting.
 * @author Watosn
 */
#pragma once

#include <vector>

#include "obsplan/catalog/target.hpp"
#include "obsplan/ephem/sky_state.hpp"

namespace obsplan::visibility {

/**
 * @brief One sample of a target track.
 */
struct TrackPoint {
  double utc_seconds{};
  core::Horizontal altaz{};
  double airmass{};
  double hour_angle_deg{};
  double parallactic_angle_deg{};
  double moon_separation_deg{};
  double sun_alt_deg{};
};

struct TrackResult {
  std::vector<TrackPoint> points{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Sample the target over the cache's time range at the range's step, end point included.
 */
[[nodiscard]] TrackResult sky_track(const catalog::Target& target, const ephem::SkyStateCache& sky);

/**
 * @brief Same as above, building a cache for `site` and `span`.
 */
[[nodiscard]] TrackResult sky_track(const catalog::Target& target, const site::Site& site, const core::TimeSpec& span);

}  // namespace obsplan::visibility
