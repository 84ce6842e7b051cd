/**
 * @file test_constraints.cpp
 * @brief Constraint predicates, crossing search and defaults profile tests.
 * @author Watosn
 */

#include <cmath>
#include <algorithm>
#include <filesystem>
#include <limits>
#include <memory>
#include <sstream>

#include <spdlog/spdlog.h>

#include "obsplan/constraints/constraint_set.hpp"
#include "obsplan/constraints/constraints.hpp"
#include "obsplan/constraints/crossing_finder.hpp"
#include "obsplan/constraints/defaults.hpp"
#include "obsplan/core/time_utils.hpp"
#include "obsplan/site/site_registry.hpp"

namespace {

using namespace obsplan;

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

double at(const char* iso) { return *core::parse_iso8601(iso); }

// Every crossing in `a` has a partner in `b` within `tol` and the counts agree.
bool same_crossings(const std::vector<double>& a, const std::vector<double>& b, double tol) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!approx_abs(a[i], b[i], tol)) {
      return false;
    }
  }
  return true;
}

catalog::Target make_target(const char* id, double ra_deg, double dec_deg) {
  catalog::Target t{};
  t.id = id;
  t.position = core::Equatorial{.ra_deg = ra_deg, .dec_deg = dec_deg};
  return t;
}

}  // namespace

int main() {
  const constraints::CrossingOptions options{};

  const constraints::MarginFunction wave = [](double t) { return std::sin(2.0 * core::constants::kPi * t / 1000.0); };
  const auto found = constraints::find_crossings(wave, 10.0, 2990.0, 50.0, options);
  if (found.status != core::Status::Ok || !same_crossings(found.times, {500.0, 1000.0, 1500.0, 2000.0, 2500.0}, 1.0)) {
    spdlog::error("scan/bisection crossing mismatch ({} found)", found.times.size());
    return 1;
  }
  const constraints::MarginFunction line = [](double t) { return t - 100.3; };
  const auto refined = constraints::refine_crossing(line, 0.0, 200.0, options);
  const auto starved = constraints::refine_crossing(line, 0.0, 200.0, {.tolerance_s = 1.0, .max_iterations = 3});
  if (refined.status != core::Status::Ok || !approx_abs(refined.time, 100.3, 1.0)
      || starved.status != core::Status::NumericNonConvergence) {
    spdlog::error("bisection refinement mismatch");
    return 2;
  }
  const constraints::MarginFunction broken = [](double t) { return (t > 40.0 && t < 60.0) ? std::nan("") : 1.0; };
  const auto nan_scan = constraints::find_crossings(broken, 0.0, 100.0, 25.0, options);
  if (nan_scan.status != core::Status::NumericNonConvergence || nan_scan.unresolved.empty()) {
    spdlog::error("non-finite margin not reported as unresolved");
    return 3;
  }
  std::vector<double> dupes{5.0, 1.0, 5.4, 9.0};
  constraints::normalize_crossings(dupes, 1.0);
  if (!same_crossings(dupes, {1.0, 5.0, 9.0}, 0.0)) {
    spdlog::error("crossing normalization mismatch");
    return 4;
  }

  if (constraints::ElevationConstraint::Create({.min_alt_deg = 40.0, .max_alt_deg = 30.0}) != nullptr
      || constraints::ElevationConstraint::Create({.min_alt_deg = 90.0, .max_alt_deg = 90.0}) == nullptr
      || constraints::AirmassConstraint::Create({.max_airmass = 0.9}) != nullptr
      || constraints::MoonSeparationConstraint::Create({.min_separation_deg = -1.0}) != nullptr
      || constraints::MoonIlluminationConstraint::Create({.max_fraction = 1.5}) != nullptr
      || constraints::CustomConstraint::Create({.name = "empty"}) != nullptr
      || constraints::AzimuthConstraint::Create({.min_az_deg = 10.0, .max_az_deg = 10.0}) != nullptr) {
    spdlog::error("constraint factory validation mismatch");
    return 5;
  }

  const auto registry = site::SiteRegistry::Create({});
  const site::Site& subaru = *registry->find("subaru");
  const core::TimeSpec span{.start = {at("2024-01-10T00:00:00Z")}, .end = {at("2024-01-12T00:00:00Z")}, .step_s = 300.0};
  const auto sky = ephem::SkyStateCache::Create(subaru, span);
  const catalog::Target orion = make_target("orion", 83.8221, -5.3911);

  // Closed-form seeded crossings agree with a fine generic scan.
  const constraints::CrossingOptions fine{.scan_step_s = 60.0};
  const auto elevation = constraints::ElevationConstraint::Create({.min_alt_deg = 30.0, .max_alt_deg = 60.0});
  const auto seeded = elevation->boundary_crossings(orion, *sky, span, options);
  const auto scanned = elevation->IConstraint::boundary_crossings(orion, *sky, span, fine);
  if (seeded.status != core::Status::Ok || seeded.times.empty() || !same_crossings(seeded.times, scanned.times, 2.0)) {
    spdlog::error("seeded elevation crossings disagree with scan ({} vs {})", seeded.times.size(), scanned.times.size());
    return 6;
  }
  const auto airmass = constraints::AirmassConstraint::Create({.max_airmass = 1.5});
  const auto am_seeded = airmass->boundary_crossings(orion, *sky, span, options);
  const auto am_scanned = airmass->IConstraint::boundary_crossings(orion, *sky, span, fine);
  if (am_seeded.times.size() != 4U || !same_crossings(am_seeded.times, am_scanned.times, 2.0)) {
    spdlog::error("seeded airmass crossings disagree with scan ({} vs {})", am_seeded.times.size(), am_scanned.times.size());
    return 7;
  }
  for (const double t : am_seeded.times) {
    const double m = constraints::margin_at(*airmass, orion, *sky, t);
    if (!approx_abs(m, 0.0, 0.01)) {
      spdlog::error("airmass margin at crossing not near zero: {}", m);
      return 8;
    }
  }

  // Nautical twilight: one dusk and one dawn per night.
  const auto dark = constraints::SunAltitudeConstraint::ForTwilight(constraints::Twilight::Nautical);
  const auto twilight = constraints::boundary_crossings(*dark, orion, subaru, span);
  if (twilight.status != core::Status::Ok || twilight.times.size() != 4U || !dark->target_independent()) {
    spdlog::error("twilight crossings mismatch ({} found)", twilight.times.size());
    return 9;
  }

  // A day-long step is capped, so no dusk or dawn slips between two scan points.
  const core::TimeSpec coarse_span{.start = span.start, .end = span.end, .step_s = 86400.0};
  const auto coarse_twilight = dark->boundary_crossings(orion, *sky, coarse_span, options);
  if (coarse_twilight.status != core::Status::Ok || !same_crossings(coarse_twilight.times, twilight.times, 2.0)) {
    spdlog::error("coarse scan lost twilight crossings ({} found)", coarse_twilight.times.size());
    return 19;
  }

  // An empty profile lifts a negative floor to the flat horizon.
  const auto below_horizon = constraints::ElevationConstraint::Create({.min_alt_deg = -5.0, .use_horizon = true});
  const auto flat_0 = constraints::ElevationConstraint::Create({.min_alt_deg = 0.0});
  const auto lifted = below_horizon->boundary_crossings(orion, *sky, span, options);
  const auto at_zero = flat_0->boundary_crossings(orion, *sky, span, options);
  if (lifted.status != core::Status::Ok || at_zero.times.empty() || !same_crossings(lifted.times, at_zero.times, 2.0)) {
    spdlog::error("flat horizon crossings mismatch ({} vs {})", lifted.times.size(), at_zero.times.size());
    return 20;
  }

  // Horizon profile above the floor routes through the generic scan.
  site::Site ridge = subaru;
  ridge.horizon = *site::HorizonProfile::Parse("0:35;90:35;180:35;270:35");
  const auto ridge_sky = ephem::SkyStateCache::Create(ridge, span);
  const auto with_horizon = constraints::ElevationConstraint::Create({.min_alt_deg = 30.0, .use_horizon = true});
  const auto flat_35 = constraints::ElevationConstraint::Create({.min_alt_deg = 35.0});
  const auto h_times = with_horizon->boundary_crossings(orion, *ridge_sky, span, options);
  const auto f_times = flat_35->boundary_crossings(orion, *ridge_sky, span, options);
  if (h_times.times.empty() || !same_crossings(h_times.times, f_times.times, 2.0)) {
    spdlog::error("horizon-raised floor crossings mismatch");
    return 10;
  }

  ephem::SkySample sample = ephem::sky_sample(subaru, span.start.utc_seconds);
  constraints::EvaluationContext ctx{.target = orion, .site = subaru, .sky = sample};
  const auto north = constraints::AzimuthConstraint::Create({.min_az_deg = 350.0, .max_az_deg = 10.0});
  ctx.state.altaz = core::Horizontal{.alt_deg = 45.0, .az_deg = 5.0};
  const double inside = north->margin(ctx);
  ctx.state.altaz.az_deg = 180.0;
  const double outside = north->margin(ctx);
  if (!approx_abs(inside, 5.0, 1e-9) || !(outside < 0.0)) {
    spdlog::error("wrapped azimuth arc mismatch: {} {}", inside, outside);
    return 11;
  }

  const constraints::ConstraintSet empty{};
  const constraints::ConstraintSet::Item custom = constraints::CustomConstraint::Create(
      {.name = "rotator", .margin = [](const constraints::EvaluationContext& c) { return c.state.altaz.alt_deg - 50.0; }});
  const constraints::ConstraintSet with_null({nullptr, nullptr});
  if (!std::isinf(empty.margin(ctx)) || !empty.satisfied(ctx) || !with_null.empty()) {
    spdlog::error("empty constraint set mismatch");
    return 12;
  }
  const constraints::ConstraintSet one = empty.with(custom);
  ctx.state.altaz.alt_deg = 40.0;
  const auto failing = one.failing(ctx);
  if (one.size() != 1U || one.satisfied(ctx) || failing.size() != 1U || failing.front() != constraints::ConstraintKind::Custom) {
    spdlog::error("custom constraint evaluation mismatch");
    return 13;
  }

  const auto defaults = constraints::make_default_set({});
  site::Site bad_site = subaru;
  bad_site.location.lat_deg = std::numeric_limits<double>::quiet_NaN();
  const catalog::Target bad_target = make_target("bad", 400.0, 0.0);
  const auto r_site = constraints::evaluate(defaults.set, orion, bad_site, core::Epoch{span.start.utc_seconds});
  const auto r_target = constraints::evaluate(defaults.set, bad_target, subaru, core::Epoch{span.start.utc_seconds});
  const auto r_time = constraints::evaluate(defaults.set, orion, subaru, core::Epoch{at("2150-01-01T00:00:00Z")});
  if (r_site.status != core::Status::InvalidSite || r_target.status != core::Status::InvalidTarget
      || r_time.status != core::Status::InvalidTime) {
    spdlog::error("evaluate status mismatch");
    return 14;
  }
  // Local noon in Hawaii: the Sun fails the darkness requirement.
  const auto noon = constraints::evaluate(defaults.set, orion, subaru, core::Epoch{at("2024-01-10T22:00:00Z")});
  if (noon.status != core::Status::Ok || noon.satisfied
      || std::find(noon.failing.begin(), noon.failing.end(), constraints::ConstraintKind::SunAltitude) == noon.failing.end()) {
    spdlog::error("daytime evaluation should fail on sun altitude");
    return 15;
  }

  std::istringstream profile(
      "# instrument defaults\n"
      "min_elevation_deg = 25\n"
      "twilight = astronomical\n"
      "max_airmass = 1.8   # tight\n"
      "min_moon_separation_deg = off\n"
      "dome_limit = 3\n");
  const auto parsed = constraints::parse_constraint_defaults(profile);
  if (parsed.status != core::Status::Ok || parsed.defaults.min_elevation_deg != 25.0 || !parsed.defaults.max_airmass
      || *parsed.defaults.max_airmass != 1.8 || parsed.defaults.min_moon_separation_deg
      || parsed.defaults.max_sun_altitude_deg != -18.0) {
    spdlog::error("constraint profile parse mismatch");
    return 16;
  }
  std::istringstream bad_profile("max_airmass = heavy\n");
  std::istringstream no_equals("min_elevation_deg 20\n");
  if (constraints::parse_constraint_defaults(bad_profile).status != core::Status::InvalidInput
      || constraints::parse_constraint_defaults(no_equals).status != core::Status::InvalidInput
      || constraints::load_constraint_defaults(std::filesystem::path("/nonexistent/obsplan.profile")).status
             != core::Status::DataUnavailable) {
    spdlog::error("malformed constraint profile accepted");
    return 17;
  }
  const auto built = constraints::make_default_set(parsed.defaults);
  const auto rejected = constraints::make_default_set({.min_elevation_deg = 95.0});
  if (defaults.set.size() != 3U || built.status != core::Status::Ok || built.set.size() != 3U
      || rejected.status != core::Status::InvalidInput) {
    spdlog::error("default constraint set mismatch");
    return 18;
  }
  return 0;
}
