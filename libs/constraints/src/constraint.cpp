/**
 * @file constraint.cpp
 * @brief Constraint context and default crossing search implementation.
 * @author Watosn
 */

#include "obsplan/constraints/constraint.hpp"

#include <algorithm>

#include "obsplan/constraints/crossing_finder.hpp"
#include "obsplan/core/constants.hpp"
#include "obsplan/core/math_utils.hpp"
#include "obsplan/core/transforms.hpp"

namespace obsplan::constraints {

std::string_view to_string(ConstraintKind kind) {
  switch (kind) {
    case ConstraintKind::Elevation:
      return "elevation";
    case ConstraintKind::Azimuth:
      return "azimuth";
    case ConstraintKind::Airmass:
      return "airmass";
    case ConstraintKind::MoonSeparation:
      return "moon_separation";
    case ConstraintKind::MoonIllumination:
      return "moon_illumination";
    case ConstraintKind::SunAltitude:
      return "sun_altitude";
    case ConstraintKind::Custom:
      return "custom";
  }
  return "unknown";
}

TargetState target_state(const catalog::Target& target, const site::Site& site, const ephem::SkySample& sky) {
  using core::constants::kDegToRad;
  using core::constants::kRadToDeg;
  TargetState out{};
  out.mean = catalog::position_at(target, sky.utc_seconds);
  out.apparent_dir = core::apparent_direction(sky.frame, core::unit_vector(out.mean.ra_deg * kDegToRad, out.mean.dec_deg * kDegToRad));
  const auto radec = core::spherical_angles(out.apparent_dir);
  const double ha = sky.lst_rad - radec[0];
  out.altaz = core::hadec_to_horizontal(ha, radec[1], site.location.lat_deg * kDegToRad);
  out.altaz.alt_deg += core::refraction_deg(out.altaz.alt_deg, site.refraction);
  out.hour_angle_deg = core::wrap_180(ha * kRadToDeg);
  return out;
}

double margin_at(const IConstraint& constraint,
                 const catalog::Target& target,
                 const ephem::SkyStateCache& sky,
                 double utc_seconds) {
  const ephem::SkySample sample = sky.at(utc_seconds);
  const EvaluationContext ctx{
      .target = target, .site = sky.site(), .sky = sample, .state = target_state(target, sky.site(), sample)};
  return constraint.margin(ctx);
}

CrossingResult IConstraint::boundary_crossings(const catalog::Target& target,
                                               const ephem::SkyStateCache& sky,
                                               const core::TimeSpec& span,
                                               const CrossingOptions& options) const {
  double step = (options.scan_step_s > 0.0) ? options.scan_step_s : span.step_s;
  if (options.max_scan_step_s > 0.0) {
    step = std::min(step, options.max_scan_step_s);
  }
  const MarginFunction f = [this, &target, &sky](double t) { return margin_at(*this, target, sky, t); };
  CrossingResult out = find_crossings(f, span.start.utc_seconds, span.end.utc_seconds, step, options);
  normalize_crossings(out.times, options.tolerance_s);
  return out;
}

}  // namespace obsplan::constraints
