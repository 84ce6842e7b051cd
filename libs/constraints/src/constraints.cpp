/**
 * @file constraints.cpp
 * @brief Concrete observability constraint implementations.
 * @author Watosn
 */

#include "obsplan/constraints/constraints.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "obsplan/constraints/crossing_finder.hpp"
#include "obsplan/core/constants.hpp"
#include "obsplan/core/math_utils.hpp"
#include "obsplan/core/time_utils.hpp"
#include "obsplan/core/transforms.hpp"

namespace obsplan::constraints {
namespace {

using core::constants::kDegToRad;
using core::constants::kRadToDeg;
using core::constants::kTwoPi;

constexpr double kSiderealRateRadPerSec = 1.00273790935 * kTwoPi / core::constants::kSecondsPerDay;
constexpr double kSiderealDayS = kTwoPi / kSiderealRateRadPerSec;
constexpr double kSeedHalfWidthS = 120.0;
// |cos H0| above this is a grazing pass: the seed bracket may not show a sign change.
constexpr double kGrazingCosH0 = 0.9999;

bool finite_all(std::initializer_list<double> values) {
  return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

/**
 * @brief Predicted times at which the true altitude equals `alt_deg`, from the hour angle at `t_ref`.
 *
 * Returns false for a grazing geometry, where prediction cannot be trusted.
 */
bool predict_altitude_crossings(double alt_deg,
                                double ha_ref_rad,
                                double dec_rad,
                                double lat_rad,
                                double t_ref,
                                double t_end,
                                std::vector<double>& seeds) {
  const double denom = std::cos(lat_rad) * std::cos(dec_rad);
  if (std::abs(denom) < 1.0e-12) {
    return true;
  }
  const double cos_h0 = (std::sin(alt_deg * kDegToRad) - std::sin(lat_rad) * std::sin(dec_rad)) / denom;
  if (std::abs(cos_h0) > 1.0) {
    return true;
  }
  if (std::abs(cos_h0) > kGrazingCosH0) {
    return false;
  }
  const double h0 = std::acos(cos_h0);
  for (const double base : {h0, kTwoPi - h0}) {
    // Start one period early so a crossing just after t_ref is not lost to prediction error.
    double t = t_ref + core::wrap_two_pi(base - ha_ref_rad) / kSiderealRateRadPerSec - kSiderealDayS;
    for (; t <= t_end + kSeedHalfWidthS; t += kSiderealDayS) {
      if (t >= t_ref - kSeedHalfWidthS) {
        seeds.push_back(t);
      }
    }
  }
  return true;
}

/**
 * @brief Crossings of an altitude-limit constraint from closed-form seeds; scans when prediction fails.
 */
CrossingResult seeded_altitude_crossings(const IConstraint& constraint,
                                         const std::vector<double>& limits_deg,
                                         const catalog::Target& target,
                                         const ephem::SkyStateCache& sky,
                                         const core::TimeSpec& span,
                                         const CrossingOptions& options) {
  const double t0 = span.start.utc_seconds;
  const double t1 = span.end.utc_seconds;
  const site::Site& site = sky.site();
  const ephem::SkySample s0 = sky.at(t0);
  const TargetState st = target_state(target, site, s0);
  const auto radec = core::spherical_angles(st.apparent_dir);
  const double ha_ref = s0.lst_rad - radec[0];

  std::vector<double> seeds;
  for (const double limit : limits_deg) {
    const double true_limit = core::unrefracted_altitude_deg(limit, site.refraction);
    if (!predict_altitude_crossings(true_limit, ha_ref, radec[1], site.location.lat_deg * kDegToRad, t0, t1, seeds)) {
      spdlog::debug("{}: grazing geometry for '{}', scanning", constraint.name(), target.id);
      return constraint.IConstraint::boundary_crossings(target, sky, span, options);
    }
  }
  std::sort(seeds.begin(), seeds.end());

  const MarginFunction f = [&constraint, &target, &sky](double t) { return margin_at(constraint, target, sky, t); };
  CrossingResult out{};
  for (std::size_t i = 0; i < seeds.size(); ++i) {
    double half = kSeedHalfWidthS;
    if (i > 0) {
      half = std::min(half, 0.5 * (seeds[i] - seeds[i - 1]));
    }
    if (i + 1 < seeds.size()) {
      half = std::min(half, 0.5 * (seeds[i + 1] - seeds[i]));
    }
    const auto r = refine_seed(f, seeds[i], half, t0, t1, options);
    if (!r) {
      // Seeds near the range ends may fall outside it; one well inside must bracket a flip.
      if (seeds[i] - half > t0 && seeds[i] + half < t1) {
        spdlog::debug("{}: no flip at predicted {} for '{}', scanning", constraint.name(), core::format_iso8601(seeds[i]),
                      target.id);
        return constraint.IConstraint::boundary_crossings(target, sky, span, options);
      }
      continue;
    }
    if (r->status == core::Status::Ok) {
      out.times.push_back(r->time);
    } else {
      out.unresolved.emplace_back(std::max(t0, seeds[i] - half), std::min(t1, seeds[i] + half));
      out.status = core::Status::NumericNonConvergence;
    }
  }
  normalize_crossings(out.times, options.tolerance_s);

  // An odd crossing count must match a flip between the span ends.
  const bool flips = (f(t0) >= 0.0) != (f(t1) >= 0.0);
  if (out.status == core::Status::Ok && ((out.times.size() % 2U) == 1U) != flips) {
    spdlog::debug("{}: predicted crossings inconsistent for '{}', scanning", constraint.name(), target.id);
    return constraint.IConstraint::boundary_crossings(target, sky, span, options);
  }
  return out;
}

}  // namespace

std::unique_ptr<ElevationConstraint> ElevationConstraint::Create(const Config& config) {
  if (!finite_all({config.min_alt_deg, config.max_alt_deg}) || config.min_alt_deg < -90.0 || config.max_alt_deg > 90.0
      || !(config.min_alt_deg <= config.max_alt_deg)) {
    return nullptr;
  }
  return std::unique_ptr<ElevationConstraint>(new ElevationConstraint(config));
}

std::string ElevationConstraint::name() const {
  return fmt::format("elevation[{:.1f},{:.1f}{}]", config_.min_alt_deg, config_.max_alt_deg,
                     config_.use_horizon ? ",horizon" : "");
}

double ElevationConstraint::margin(const EvaluationContext& ctx) const {
  double floor = config_.min_alt_deg;
  if (config_.use_horizon) {
    floor = std::max(floor, ctx.site.horizon.min_altitude_deg(ctx.state.altaz.az_deg));
  }
  return std::min(ctx.state.altaz.alt_deg - floor, config_.max_alt_deg - ctx.state.altaz.alt_deg);
}

CrossingResult ElevationConstraint::boundary_crossings(const catalog::Target& target,
                                                       const ephem::SkyStateCache& sky,
                                                       const core::TimeSpec& span,
                                                       const CrossingOptions& options) const {
  const site::HorizonProfile& horizon = sky.site().horizon;
  if (config_.use_horizon && !horizon.empty() && horizon.max_altitude_deg() > config_.min_alt_deg) {
    return IConstraint::boundary_crossings(target, sky, span, options);
  }
  // Seed on the floor margin() applies: a flat horizon still lifts a negative floor to 0.
  double floor = config_.min_alt_deg;
  if (config_.use_horizon) {
    floor = std::max(floor, horizon.max_altitude_deg());
  }
  std::vector<double> limits{floor};
  if (config_.max_alt_deg < 90.0) {
    limits.push_back(config_.max_alt_deg);
  }
  return seeded_altitude_crossings(*this, limits, target, sky, span, options);
}

std::unique_ptr<AzimuthConstraint> AzimuthConstraint::Create(const Config& config) {
  if (!finite_all({config.min_az_deg, config.max_az_deg})) {
    return nullptr;
  }
  double width = 360.0;
  if (std::abs(config.max_az_deg - config.min_az_deg) < 360.0) {
    width = core::wrap_360(config.max_az_deg - config.min_az_deg);
  }
  if (width <= 0.0) {
    return nullptr;
  }
  return std::unique_ptr<AzimuthConstraint>(new AzimuthConstraint(config, width));
}

std::string AzimuthConstraint::name() const {
  return fmt::format("azimuth[{:.1f},{:.1f}]", config_.min_az_deg, config_.max_az_deg);
}

double AzimuthConstraint::margin(const EvaluationContext& ctx) const {
  if (width_deg_ >= 360.0) {
    return 180.0;
  }
  const double d = core::wrap_360(ctx.state.altaz.az_deg - config_.min_az_deg);
  if (d <= width_deg_) {
    return std::min(d, width_deg_ - d);
  }
  return -std::min(d - width_deg_, 360.0 - d);
}

std::unique_ptr<AirmassConstraint> AirmassConstraint::Create(const Config& config) {
  if (!std::isfinite(config.max_airmass) || config.max_airmass < 1.0) {
    return nullptr;
  }
  return std::unique_ptr<AirmassConstraint>(new AirmassConstraint(config, core::altitude_for_airmass(config.max_airmass)));
}

std::string AirmassConstraint::name() const { return fmt::format("airmass[<={:.2f}]", config_.max_airmass); }

double AirmassConstraint::margin(const EvaluationContext& ctx) const { return ctx.state.altaz.alt_deg - min_alt_deg_; }

CrossingResult AirmassConstraint::boundary_crossings(const catalog::Target& target,
                                                     const ephem::SkyStateCache& sky,
                                                     const core::TimeSpec& span,
                                                     const CrossingOptions& options) const {
  return seeded_altitude_crossings(*this, {min_alt_deg_}, target, sky, span, options);
}

std::unique_ptr<MoonSeparationConstraint> MoonSeparationConstraint::Create(const Config& config) {
  if (!std::isfinite(config.min_separation_deg) || config.min_separation_deg < 0.0 || config.min_separation_deg > 180.0) {
    return nullptr;
  }
  return std::unique_ptr<MoonSeparationConstraint>(new MoonSeparationConstraint(config));
}

std::string MoonSeparationConstraint::name() const {
  return fmt::format("moon_separation[>={:.1f}]", config_.min_separation_deg);
}

double MoonSeparationConstraint::margin(const EvaluationContext& ctx) const {
  return core::angle_between(ctx.state.apparent_dir, ctx.sky.sun_moon.moon_dir) * kRadToDeg - config_.min_separation_deg;
}

std::unique_ptr<MoonIlluminationConstraint> MoonIlluminationConstraint::Create(const Config& config) {
  if (!std::isfinite(config.max_fraction) || config.max_fraction < 0.0 || config.max_fraction > 1.0) {
    return nullptr;
  }
  return std::unique_ptr<MoonIlluminationConstraint>(new MoonIlluminationConstraint(config));
}

std::string MoonIlluminationConstraint::name() const {
  return fmt::format("moon_illumination[<={:.2f}]", config_.max_fraction);
}

double MoonIlluminationConstraint::margin(const EvaluationContext& ctx) const {
  // Scaled so a 0.01 fraction excess weighs like 1 deg of Moon altitude.
  return std::max(-ctx.sky.moon.alt_deg, 100.0 * (config_.max_fraction - ctx.sky.sun_moon.moon_illuminated_fraction));
}

double twilight_altitude_deg(Twilight twilight) {
  switch (twilight) {
    case Twilight::Sunset:
      return -0.833;
    case Twilight::Civil:
      return -6.0;
    case Twilight::Nautical:
      return -12.0;
    case Twilight::Astronomical:
      return -18.0;
  }
  return -12.0;
}

std::string_view to_string(Twilight twilight) {
  switch (twilight) {
    case Twilight::Sunset:
      return "sunset";
    case Twilight::Civil:
      return "civil";
    case Twilight::Nautical:
      return "nautical";
    case Twilight::Astronomical:
      return "astronomical";
  }
  return "unknown";
}

std::optional<Twilight> parse_twilight(std::string_view text) {
  for (const Twilight t : {Twilight::Sunset, Twilight::Civil, Twilight::Nautical, Twilight::Astronomical}) {
    if (text == to_string(t)) {
      return t;
    }
  }
  return std::nullopt;
}

std::unique_ptr<SunAltitudeConstraint> SunAltitudeConstraint::Create(const Config& config) {
  if (!std::isfinite(config.max_sun_alt_deg) || config.max_sun_alt_deg < -90.0 || config.max_sun_alt_deg > 90.0) {
    return nullptr;
  }
  return std::unique_ptr<SunAltitudeConstraint>(new SunAltitudeConstraint(config));
}

std::string SunAltitudeConstraint::name() const { return fmt::format("sun_altitude[<={:.2f}]", config_.max_sun_alt_deg); }

double SunAltitudeConstraint::margin(const EvaluationContext& ctx) const {
  return config_.max_sun_alt_deg - ctx.sky.sun.alt_deg;
}

std::unique_ptr<CustomConstraint> CustomConstraint::Create(Config config) {
  if (!config.margin) {
    return nullptr;
  }
  return std::unique_ptr<CustomConstraint>(new CustomConstraint(std::move(config)));
}

}  // namespace obsplan::constraints
