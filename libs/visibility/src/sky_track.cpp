/**
 * @file sky_track.cpp
 * @brief Target track sampling.
 * @author Watosn
 */

#include "obsplan/visibility/sky_track.hpp"

#include <algorithm>
#include <cmath>

#include "obsplan/constraints/constraint.hpp"
#include "obsplan/core/constants.hpp"
#include "obsplan/core/math_utils.hpp"
#include "obsplan/core/transforms.hpp"

namespace obsplan::visibility {

TrackResult sky_track(const catalog::Target& target, const ephem::SkyStateCache& sky) {
  TrackResult out{};
  if (catalog::validate_target(target) != core::Status::Ok) {
    out.status = core::Status::InvalidTarget;
    return out;
  }
  const core::TimeSpec& span = sky.span();
  const double lat = sky.site().location.lat_deg;
  const auto n = static_cast<std::size_t>(std::ceil(span.duration_s() / span.step_s));
  out.points.reserve(n + 1U);
  for (std::size_t i = 0; i <= n; ++i) {
    const double t = std::min(span.start.utc_seconds + static_cast<double>(i) * span.step_s, span.end.utc_seconds);
    const ephem::SkySample sample = sky.at(t);
    const constraints::TargetState st = constraints::target_state(target, sky.site(), sample);
    const double dec_app = core::spherical_angles(st.apparent_dir)[1] * core::constants::kRadToDeg;
    out.points.push_back(TrackPoint{
        .utc_seconds = t,
        .altaz = st.altaz,
        .airmass = core::airmass(st.altaz.alt_deg),
        .hour_angle_deg = st.hour_angle_deg,
        .parallactic_angle_deg = core::parallactic_angle_deg(st.hour_angle_deg, dec_app, lat),
        .moon_separation_deg = core::angle_between(st.apparent_dir, sample.sun_moon.moon_dir) * core::constants::kRadToDeg,
        .sun_alt_deg = sample.sun.alt_deg,
    });
  }
  return out;
}

TrackResult sky_track(const catalog::Target& target, const site::Site& site, const core::TimeSpec& span) {
  core::Status st = core::Status::Ok;
  const auto sky = ephem::SkyStateCache::Create(site, span, &st);
  if (!sky) {
    return TrackResult{.status = st};
  }
  return sky_track(target, *sky);
}

}  // namespace obsplan::visibility
