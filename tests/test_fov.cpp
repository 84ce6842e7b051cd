/**
 * @file test_fov.cpp
 * @brief Instrument footprint, projection and dither coverage tests.
 * @author Watosn
 */

#include <cmath>
#include <vector>

#include <spdlog/spdlog.h>

#include "obsplan/fov/dither.hpp"
#include "obsplan/fov/footprint.hpp"

namespace {

using namespace obsplan;

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

catalog::Target make_target(const char* id, const core::Equatorial& p) {
  catalog::Target t{};
  t.id = id;
  t.position = p;
  return t;
}

}  // namespace

int main() {
  const core::Equatorial center{.ra_deg = 150.0, .dec_deg = 30.0};

  const core::Equatorial nearby{.ra_deg = 150.05, .dec_deg = 30.03};
  const auto plane = fov::project(center, nearby);
  if (!plane) {
    spdlog::error("projection of a nearby point failed");
    return 1;
  }
  const auto back = fov::deproject(center, *plane);
  if (!approx_abs(back.ra_deg, nearby.ra_deg, 1e-9) || !approx_abs(back.dec_deg, nearby.dec_deg, 1e-9)) {
    spdlog::error("gnomonic round trip failure");
    return 2;
  }
  const auto north = fov::deproject(center, fov::PlanePoint{0.0, 3600.0});
  const auto east = fov::deproject(center, fov::PlanePoint{3600.0, 0.0});
  if (!approx_abs(north.ra_deg, 150.0, 1e-9) || !approx_abs(north.dec_deg, 31.0, 1e-3) || !(east.ra_deg > 150.0)
      || fov::project(center, core::Equatorial{.ra_deg = 330.0, .dec_deg = -30.0})) {
    spdlog::error("tangent plane orientation mismatch");
    return 3;
  }

  const auto* square = fov::find_instrument("square10");
  if (square == nullptr || fov::find_instrument("hsc") == nullptr || fov::find_instrument("nope") != nullptr) {
    spdlog::error("built-in instrument lookup failure");
    return 4;
  }
  const auto at_pa0 = fov::footprint_at(*square, {.center = center, .pa_deg = 0.0});
  const auto at_pa45 = fov::footprint_at(*square, {.center = center, .pa_deg = 45.0});
  if (at_pa0.status != core::Status::Ok || at_pa45.status != core::Status::Ok || at_pa0.footprint.sky.size() != 1U
      || at_pa0.footprint.sky.front().size() != 4U) {
    spdlog::error("square footprint construction failure");
    return 5;
  }
  // Side S = 600": centre inside; beyond S/sqrt(2) on the diagonal is outside at any angle.
  const auto beyond_corner = fov::deproject(center, fov::PlanePoint{1.05 * 300.0, 1.05 * 300.0});
  const auto just_east = fov::deproject(center, fov::PlanePoint{310.0, 0.0});
  if (!fov::contains(at_pa0.footprint, center) || fov::contains(at_pa0.footprint, beyond_corner)
      || fov::contains(at_pa45.footprint, fov::deproject(center, fov::PlanePoint{0.0, 1.05 * 300.0 * std::sqrt(2.0)}))) {
    spdlog::error("square containment mismatch");
    return 6;
  }
  // Rotating by 45 deg brings a corner onto the east axis.
  if (fov::contains(at_pa0.footprint, just_east) || !fov::contains(at_pa45.footprint, just_east)) {
    spdlog::error("position angle rotation mismatch");
    return 7;
  }

  const auto* moircs = fov::find_instrument("moircs");
  const auto tall = fov::footprint_at(*moircs, {.center = center, .pa_deg = 0.0});
  const auto turned = fov::footprint_at(*moircs, {.center = center, .pa_deg = 90.0});
  const auto p_north = fov::deproject(center, fov::PlanePoint{0.0, 200.0});
  const auto p_east = fov::deproject(center, fov::PlanePoint{200.0, 0.0});
  if (!fov::contains(tall.footprint, p_north) || fov::contains(tall.footprint, p_east) || fov::contains(turned.footprint, p_north)
      || !fov::contains(turned.footprint, p_east)) {
    spdlog::error("position angle must turn +y from north toward east");
    return 8;
  }

  const fov::Polygon ell{{0.0, 0.0}, {200.0, 0.0}, {200.0, 100.0}, {100.0, 100.0}, {100.0, 200.0}, {0.0, 200.0}};
  if (fov::point_in_polygon(ell, {150.0, 150.0}) || !fov::point_in_polygon(ell, {50.0, 150.0})
      || !fov::point_in_polygon(ell, {150.0, 50.0}) || fov::point_in_polygon(ell, {250.0, 50.0})) {
    spdlog::error("non-convex point-in-polygon mismatch");
    return 9;
  }

  // The boresight of the 5x2 mosaic falls in the gap between detector rows.
  const auto* spcam = fov::find_instrument("spcam");
  const auto mosaic = fov::footprint_at(*spcam, {.center = center, .pa_deg = 0.0});
  if (mosaic.footprint.plane.size() != 10U || fov::contains(mosaic.footprint, center)
      || !fov::contains(mosaic.footprint, fov::deproject(center, fov::PlanePoint{0.0, 400.0}))
      || fov::contains(mosaic.footprint, fov::deproject(center, fov::PlanePoint{-638.4, 400.0}))) {
    spdlog::error("mosaic gap handling mismatch");
    return 10;
  }

  const fov::InstrumentProfile degenerate{.name = "line", .polygons = {fov::Polygon{fov::PlanePoint{0.0, 0.0}, fov::PlanePoint{1.0, 1.0}}}};
  if (fov::validate_profile(degenerate) != core::Status::InvalidInput
      || fov::footprint_at(degenerate, {.center = center}).status != core::Status::InvalidInput
      || fov::footprint_at(*square, {.center = {.ra_deg = 10.0, .dec_deg = 95.0}}).status != core::Status::InvalidTarget
      || fov::footprint_at(*square, {.center = center, .pa_deg = std::nan("")}).status != core::Status::InvalidInput) {
    spdlog::error("footprint input validation mismatch");
    return 11;
  }

  const std::vector<catalog::Target> targets{
      make_target("zeta", fov::deproject(center, fov::PlanePoint{100.0, -100.0})),
      make_target("alpha", center),
      make_target("far", core::Equatorial{.ra_deg = 151.0, .dec_deg = 30.0}),
      make_target("alpha", center),
  };
  const auto ids = fov::targets_in_footprint(at_pa0.footprint, targets);
  if (ids.size() != 2U || ids[0] != "alpha" || ids[1] != "zeta") {
    spdlog::error("targets in footprint mismatch");
    return 12;
  }

  const fov::Pointing boresight{.center = center, .pa_deg = 0.0};
  const auto cross = fov::dither_pointings(boresight, fov::DitherPattern::Cross5, 0, 60.0);
  std::vector<fov::FOVFootprint> footprints;
  for (const auto& p : cross) {
    footprints.push_back(fov::footprint_at(*square, p).footprint);
  }
  const auto offside = fov::deproject(center, fov::PlanePoint{330.0, 0.0});
  if (cross.size() != 5U || !approx_abs(cross[0].center.ra_deg, center.ra_deg, 1e-9) || fov::coverage_count(footprints, center) != 5U
      || fov::coverage_count(footprints, offside) != 2U || !fov::union_contains(footprints, offside)
      || fov::union_contains(footprints, fov::deproject(center, fov::PlanePoint{0.0, 500.0}))) {
    spdlog::error("cross dither coverage mismatch");
    return 13;
  }

  const auto ring = fov::dither_pointings(boresight, fov::DitherPattern::Circular, 4, 100.0);
  const auto single = fov::dither_pointings(boresight, fov::DitherPattern::Single, 7, 100.0);
  if (ring.size() != 4U || !approx_abs(ring[0].center.dec_deg, 30.0 + 100.0 / 3600.0, 1e-6) || single.size() != 1U
      || fov::parse_dither_pattern("cross5") != fov::DitherPattern::Cross5 || fov::parse_dither_pattern("spiral")) {
    spdlog::error("dither pattern layout mismatch");
    return 14;
  }
  return 0;
}
