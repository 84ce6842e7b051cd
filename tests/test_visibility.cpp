/**
 * @file test_visibility.cpp
 * @brief Observability window engine, batch and window table tests.
 * @author Watosn
 */

#include <cmath>
#include <algorithm>
#include <memory>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "obsplan/constraints/constraints.hpp"
#include "obsplan/constraints/defaults.hpp"
#include "obsplan/core/time_utils.hpp"
#include "obsplan/ephem/sun_moon.hpp"
#include "obsplan/site/site_registry.hpp"
#include "obsplan/visibility/sky_track.hpp"
#include "obsplan/visibility/visibility_engine.hpp"
#include "obsplan/visibility/window_table.hpp"

namespace {

using namespace obsplan;

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

double at(const char* iso) { return *core::parse_iso8601(iso); }

catalog::Target make_target(const char* id, double ra_deg, double dec_deg) {
  catalog::Target t{};
  t.id = id;
  t.position = core::Equatorial{.ra_deg = ra_deg, .dec_deg = dec_deg};
  return t;
}

constraints::ConstraintSet floor_only(double min_alt_deg) {
  return constraints::ConstraintSet({constraints::ElevationConstraint::Create({.min_alt_deg = min_alt_deg})});
}

bool sorted_disjoint(const std::vector<visibility::ObservabilityWindow>& windows) {
  for (std::size_t i = 0; i < windows.size(); ++i) {
    if (!(windows[i].start_utc_s < windows[i].end_utc_s)) {
      return false;
    }
    if (i > 0 && !(windows[i - 1].end_utc_s < windows[i].start_utc_s)) {
      return false;
    }
  }
  return true;
}

bool same_windows(const std::vector<visibility::ObservabilityWindow>& a, const std::vector<visibility::ObservabilityWindow>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i].target_id != b[i].target_id || a[i].start_utc_s != b[i].start_utc_s || a[i].end_utc_s != b[i].end_utc_s
        || a[i].max_alt_deg != b[i].max_alt_deg) {
      return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  site::Site maunakea{};
  maunakea.id = "maunakea";
  maunakea.location = core::GeodeticPoint{.lat_deg = 19.825, .lon_deg = -155.48, .alt_m = 4200.0};
  maunakea.timezone_hours = -10.0;

  const double t0 = at("2024-03-01T00:00:00Z");
  const core::TimeSpec day{.start = {t0}, .end = {t0 + 86400.0}, .step_s = 300.0};

  // Start the range with the target at lower culmination: it rises and sets exactly once.
  const auto lst = site::local_sidereal_time(maunakea, core::Epoch{t0});
  if (lst.status != core::Status::Ok) {
    spdlog::error("local sidereal time failed");
    return 1;
  }
  const catalog::Target dec40 = make_target("dec40", core::wrap_360(lst.deg - 180.0), 40.0);
  const auto engine = visibility::VisibilityEngine::Create({});
  const auto single = engine->compute_windows(dec40, maunakea, floor_only(30.0), day);
  if (single.status != core::Status::Ok || single.windows.size() != 1U) {
    spdlog::error("expected one window for a circumpolar-free pass, got {}", single.windows.size());
    return 2;
  }
  const auto& w = single.windows.front();
  // cos H0 = (sin 30 - sin 19.825 sin 40) / (cos 19.825 cos 40); two H0 of sidereal time above the floor.
  const double lat = 19.825 * core::constants::kDegToRad;
  const double dec = 40.0 * core::constants::kDegToRad;
  const double h0 = std::acos((0.5 - std::sin(lat) * std::sin(dec)) / (std::cos(lat) * std::cos(dec)));
  const double expected_s = 2.0 * h0 / (1.00273790935 * core::constants::kTwoPi / 86400.0);
  if (!approx_abs(w.duration_s(), expected_s, 0.03 * 3600.0) || !approx_abs(w.max_alt_deg, 90.0 - 40.0 + 19.825, 0.5)
      || !approx_abs(w.min_airmass, core::airmass(w.max_alt_deg), 1e-12) || !w.contains(w.max_alt_utc_s)) {
    spdlog::error("window geometry mismatch: {:.0f} s (expected {:.0f}), max alt {:.3f}", w.duration_s(), expected_s,
                  w.max_alt_deg);
    return 3;
  }
  const auto edge = site::equatorial_to_horizontal(maunakea, core::Epoch{w.start_utc_s}, dec40.position);
  if (!approx_abs(edge.position.alt_deg, 30.0, 0.01)) {
    spdlog::error("window start altitude {} not at the floor", edge.position.alt_deg);
    return 4;
  }

  const auto zenith_only = engine->compute_windows(
      dec40, maunakea, constraints::ConstraintSet({constraints::ElevationConstraint::Create({.min_alt_deg = 90.0, .max_alt_deg = 90.0})}), day);
  const auto never_rises = engine->compute_windows(make_target("south", 10.0, -80.0), maunakea, floor_only(0.0), day);
  if (zenith_only.status != core::Status::Ok || !zenith_only.windows.empty() || never_rises.status != core::Status::Ok
      || !never_rises.windows.empty()) {
    spdlog::error("unreachable floors must give an empty, successful result");
    return 5;
  }
  const auto unconstrained = engine->compute_windows(dec40, maunakea, constraints::ConstraintSet{}, day);
  if (unconstrained.windows.size() != 1U || unconstrained.windows.front().start_utc_s != day.start.utc_seconds
      || unconstrained.windows.front().end_utc_s != day.end.utc_seconds) {
    spdlog::error("empty constraint set must cover the whole range");
    return 6;
  }

  site::Site broken = maunakea;
  broken.location.lon_deg = std::nan("");
  const core::TimeSpec reversed{.start = day.end, .end = day.start, .step_s = 300.0};
  if (engine->compute_windows(dec40, broken, floor_only(30.0), day).status != core::Status::InvalidSite
      || engine->compute_windows(make_target("bad", -1.0, 0.0), maunakea, floor_only(30.0), day).status
             != core::Status::InvalidTarget
      || engine->compute_windows(dec40, maunakea, floor_only(30.0), reversed).status != core::Status::InvalidInput
      || visibility::VisibilityEngine::Create({.min_gap_s = -1.0}) != nullptr) {
    spdlog::error("invalid input status mismatch");
    return 7;
  }

  // A 30 s veto inside the window is bridged by the minimum gap and kept when the gap is zero.
  const double veto = w.max_alt_utc_s;
  const constraints::ConstraintSet vetoed = floor_only(30.0).with(constraints::CustomConstraint::Create(
      {.name = "veto", .margin = [veto](const constraints::EvaluationContext& c) { return std::abs(c.sky.utc_seconds - veto) - 15.0; }}));
  const auto fine_engine = visibility::VisibilityEngine::Create({.crossing = {.scan_step_s = 10.0}});
  const auto split_engine = visibility::VisibilityEngine::Create({.min_gap_s = 0.0, .crossing = {.scan_step_s = 10.0}});
  const auto bridged = fine_engine->compute_windows(dec40, maunakea, vetoed, day);
  const auto split = split_engine->compute_windows(dec40, maunakea, vetoed, day);
  if (bridged.windows.size() != 1U || split.windows.size() != 2U || !sorted_disjoint(split.windows)
      || !approx_abs(split.windows[1].start_utc_s - split.windows[0].end_utc_s, 30.0, 2.0)) {
    spdlog::error("minimum gap coalescing mismatch: {} bridged, {} split", bridged.windows.size(), split.windows.size());
    return 8;
  }

  // Non-finite margins are sampled densely instead of failing the target.
  const constraints::ConstraintSet flaky = floor_only(30.0).with(constraints::CustomConstraint::Create(
      {.name = "flaky", .margin = [veto](const constraints::EvaluationContext& c) {
         return std::abs(c.sky.utc_seconds - veto) < 100.0 ? std::nan("") : 1.0;
       }}));
  const auto degraded = fine_engine->compute_windows(dec40, maunakea, flaky, day);
  if (degraded.status != core::Status::Ok || degraded.fallback_brackets == 0U || degraded.windows.empty()) {
    spdlog::error("non-converging crossings not handled by dense sampling");
    return 9;
  }

  const auto registry = site::SiteRegistry::Create({});
  const auto defaults = constraints::make_default_set({});
  std::vector<catalog::Target> targets{
      make_target("m42", 83.8221, -5.3911), make_target("bad", 361.0, 0.0), make_target("m31", 10.6847, 41.2690),
      make_target("m13", 250.4235, 36.4613), make_target("sgr", 266.4168, -29.0078),
  };
  auto strict = std::make_shared<constraints::ConstraintSet>(floor_only(60.0));
  targets.push_back(make_target("m42_strict", 83.8221, -5.3911));
  targets.back().constraints = strict;

  const core::TimeSpec week{.start = {at("2024-01-10T00:00:00Z")}, .end = {at("2024-01-13T00:00:00Z")}, .step_s = 300.0};
  const auto serial = visibility::VisibilityEngine::Create({.workers = 1});
  const auto parallel = visibility::VisibilityEngine::Create({.workers = 4});
  const auto batch = parallel->compute_batch(targets, *registry->find("subaru"), defaults.set, week);
  const auto batch_serial = serial->compute_batch(targets, *registry->find("subaru"), defaults.set, week);
  if (batch.status != core::Status::Ok || batch.entries.size() != targets.size() || batch.site_id != "subaru") {
    spdlog::error("batch result shape mismatch");
    return 10;
  }
  for (std::size_t i = 0; i < targets.size(); ++i) {
    const auto& e = batch.entries[i];
    if (e.target_id != targets[i].id) {
      spdlog::error("batch entries out of input order");
      return 11;
    }
    const bool should_fail = targets[i].id == "bad";
    if ((e.status == core::Status::InvalidTarget) != should_fail || (!should_fail && e.status != core::Status::Ok)) {
      spdlog::error("target '{}' status {} in batch", e.target_id, core::to_string(e.status));
      return 12;
    }
    if (!sorted_disjoint(e.windows) || !same_windows(e.windows, batch_serial.entries[i].windows)) {
      spdlog::error("target '{}' windows unsorted or not deterministic across worker counts", e.target_id);
      return 13;
    }
    const auto alone = parallel->compute_windows(targets[i], *registry->find("subaru"), defaults.set, week);
    if (!should_fail && !same_windows(e.windows, alone.windows)) {
      spdlog::error("batch windows for '{}' differ from a single-target run", e.target_id);
      return 14;
    }
  }
  double loose_s = 0.0;
  double strict_s = 0.0;
  for (const auto& x : batch.entries[0].windows) {
    loose_s += x.duration_s();
  }
  for (const auto& x : batch.entries[5].windows) {
    strict_s += x.duration_s();
    if (x.max_alt_deg < 60.0 - 1e-6) {
      spdlog::error("per-target floor not applied");
      return 15;
    }
  }
  if (batch.entries[0].windows.empty() || !(strict_s < loose_s)) {
    spdlog::error("per-target constraint override mismatch: {} vs {}", strict_s, loose_s);
    return 16;
  }

  visibility::CancellationToken token;
  token.cancel();
  const auto cancelled = parallel->compute_batch(targets, *registry->find("subaru"), defaults.set, week, &token);
  if (cancelled.status != core::Status::Cancelled || cancelled.entries.size() != targets.size()
      || cancelled.entries[0].status != core::Status::Cancelled) {
    spdlog::error("cancellation not honoured");
    return 17;
  }

  const std::vector<site::Site> sites{*registry->find("subaru"), *registry->find("paranal")};
  const auto multi = parallel->compute_multi_site(targets, sites, defaults.set, week);
  if (multi.status != core::Status::Ok || multi.sites.size() != 2U || multi.sites[1].site_id != "paranal"
      || !same_windows(multi.sites[0].entries[2].windows, batch.entries[2].windows)) {
    spdlog::error("multi-site batch mismatch");
    return 18;
  }

  const std::string csv = visibility::windows_to_csv(batch.entries[0].windows);
  std::istringstream csv_in(csv);
  const auto table = visibility::parse_windows_csv(csv_in);
  if (table.status != core::Status::Ok || table.windows.size() != batch.entries[0].windows.size()
      || !approx_abs(table.windows.front().start_utc_s, batch.entries[0].windows.front().start_utc_s, 0.5)) {
    spdlog::error("window table round trip mismatch");
    return 19;
  }
  std::istringstream bad_csv("target_id,site_id,start_utc,end_utc,max_alt_deg\nm42,subaru,2024-01-10T10:00:00Z,yesterday,40\n");
  const auto bad_table = visibility::parse_windows_csv(bad_csv);
  if (bad_table.status != core::Status::InvalidInput || !bad_table.windows.empty()) {
    spdlog::error("malformed window table accepted");
    return 20;
  }

  const auto track = visibility::sky_track(dec40, maunakea, core::TimeSpec{.start = day.start, .end = day.end, .step_s = 600.0});
  if (track.status != core::Status::Ok || track.points.size() != 145U) {
    spdlog::error("sky track sample count mismatch: {}", track.points.size());
    return 21;
  }
  double track_max = -90.0;
  for (const auto& p : track.points) {
    track_max = std::max(track_max, p.altaz.alt_deg);
  }
  if (!(track_max <= w.max_alt_deg + 1e-6) || !approx_abs(track_max, w.max_alt_deg, 0.2)) {
    spdlog::error("sky track peak {} inconsistent with window peak {}", track_max, w.max_alt_deg);
    return 22;
  }

  // Three days of the same pass: one window per sidereal day, each starting on the floor.
  const core::TimeSpec three_days{.start = {t0}, .end = {t0 + 3.0 * 86400.0}, .step_s = 300.0};
  const auto daily = engine->compute_windows(dec40, maunakea, floor_only(30.0), three_days);
  if (daily.status != core::Status::Ok || daily.windows.size() != 3U || !sorted_disjoint(daily.windows)) {
    spdlog::error("expected one window per day over three days, got {}", daily.windows.size());
    return 23;
  }
  for (std::size_t i = 0; i < daily.windows.size(); ++i) {
    const auto& dw = daily.windows[i];
    const auto rise = site::equatorial_to_horizontal(maunakea, core::Epoch{dw.start_utc_s}, dec40.position);
    if (!approx_abs(rise.position.alt_deg, 30.0, 0.01) || !approx_abs(dw.duration_s(), w.duration_s(), 60.0)
        || (i > 0 && !approx_abs(dw.start_utc_s - daily.windows[i - 1].start_utc_s, 86164.09, 120.0))) {
      spdlog::error("day {} window does not repeat the first pass", i);
      return 24;
    }
  }

  // Darkness windows must not depend on how coarse a step the caller asks for.
  const catalog::Target polar = make_target("polar", 40.0, 80.0);
  const constraints::ConstraintSet dark_sky({constraints::ElevationConstraint::Create({.min_alt_deg = 0.0}),
                                             constraints::SunAltitudeConstraint::ForTwilight(constraints::Twilight::Nautical)});
  const auto reference = engine->compute_windows(polar, maunakea, dark_sky, three_days);
  if (reference.status != core::Status::Ok || reference.windows.size() != 3U) {
    spdlog::error("expected three nights, got {}", reference.windows.size());
    return 25;
  }
  for (const double coarse_step : {46800.0, 86400.0}) {
    const core::TimeSpec coarse{.start = three_days.start, .end = three_days.end, .step_s = coarse_step};
    const auto nights = engine->compute_windows(polar, maunakea, dark_sky, coarse);
    if (nights.status != core::Status::Ok || nights.windows.size() != reference.windows.size()) {
      spdlog::error("step {:.0f} s: {} windows instead of {}", coarse_step, nights.windows.size(), reference.windows.size());
      return 26;
    }
    for (std::size_t i = 0; i < nights.windows.size(); ++i) {
      const auto& n = nights.windows[i];
      if (!approx_abs(n.start_utc_s, reference.windows[i].start_utc_s, 30.0)
          || !approx_abs(n.end_utc_s, reference.windows[i].end_utc_s, 30.0)) {
        spdlog::error("step {:.0f} s: night {} boundaries moved", coarse_step, i);
        return 27;
      }
      for (double t = n.start_utc_s + 60.0; t < n.end_utc_s - 60.0; t += 900.0) {
        const auto sun = ephem::sun_position(maunakea, core::Epoch{t});
        if (sun.position.alt_deg > -11.95) {
          spdlog::error("step {:.0f} s: sun at {:.2f} deg inside a dark window at {}", coarse_step, sun.position.alt_deg,
                        core::format_iso8601(t));
          return 28;
        }
      }
    }
  }

  // With the horizon in use a flat profile lifts a negative floor to 0 deg.
  const catalog::Target equator = make_target("equator", 120.0, 0.0);
  const auto lifted = engine->compute_windows(
      equator, maunakea,
      constraints::ConstraintSet({constraints::ElevationConstraint::Create({.min_alt_deg = -5.0, .use_horizon = true})}), three_days);
  const auto at_zero = engine->compute_windows(equator, maunakea, floor_only(0.0), three_days);
  if (lifted.status != core::Status::Ok || lifted.windows.size() < 3U || lifted.windows.size() != at_zero.windows.size()) {
    spdlog::error("flat horizon floor mismatch: {} windows vs {}", lifted.windows.size(), at_zero.windows.size());
    return 29;
  }
  for (std::size_t i = 0; i < lifted.windows.size(); ++i) {
    if (!approx_abs(lifted.windows[i].start_utc_s, at_zero.windows[i].start_utc_s, 2.0)
        || !approx_abs(lifted.windows[i].end_utc_s, at_zero.windows[i].end_utc_s, 2.0)) {
      spdlog::error("flat horizon window {} differs from a 0 deg floor", i);
      return 30;
    }
  }
  return 0;
}
