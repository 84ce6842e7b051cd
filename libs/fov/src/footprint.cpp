/**
 * @file footprint.cpp
 * @brief Instrument footprint geometry implementation.
 * @author Watosn
 */

#include "obsplan/fov/footprint.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <Eigen/Dense>

#include "obsplan/core/constants.hpp"
#include "obsplan/core/math_utils.hpp"

namespace obsplan::fov {
namespace {

using core::constants::kArcsecToRad;
using core::constants::kDegToRad;
using core::constants::kRadToDeg;

/**
 * @brief Unit vectors of the tangent plane at a sky position: boresight, east, north.
 */
struct TangentBasis {
  Eigen::Vector3d p0{};
  Eigen::Vector3d east{};
  Eigen::Vector3d north{};
};

TangentBasis tangent_basis(const core::Equatorial& center) {
  const double a = center.ra_deg * kDegToRad;
  const double d = center.dec_deg * kDegToRad;
  TangentBasis b{};
  b.p0 = Eigen::Vector3d(std::cos(d) * std::cos(a), std::cos(d) * std::sin(a), std::sin(d));
  b.east = Eigen::Vector3d(-std::sin(a), std::cos(a), 0.0);
  b.north = Eigen::Vector3d(-std::sin(d) * std::cos(a), -std::sin(d) * std::sin(a), std::cos(d));
  return b;
}

Eigen::Vector3d unit(const core::Equatorial& p) {
  const double a = p.ra_deg * kDegToRad;
  const double d = p.dec_deg * kDegToRad;
  return Eigen::Vector3d(std::cos(d) * std::cos(a), std::cos(d) * std::sin(a), std::sin(d));
}

Polygon rect(double cx, double cy, double w, double h) {
  return Polygon{{cx - 0.5 * w, cy - 0.5 * h}, {cx + 0.5 * w, cy - 0.5 * h}, {cx + 0.5 * w, cy + 0.5 * h}, {cx - 0.5 * w, cy + 0.5 * h}};
}

}  // namespace

core::Status validate_profile(const InstrumentProfile& profile) {
  if (profile.name.empty() || profile.polygons.empty()) {
    return core::Status::InvalidInput;
  }
  for (const auto& poly : profile.polygons) {
    if (poly.size() < 3U) {
      return core::Status::InvalidInput;
    }
    for (const auto& v : poly) {
      if (!std::isfinite(v.x_arcsec) || !std::isfinite(v.y_arcsec)) {
        return core::Status::InvalidInput;
      }
    }
  }
  return core::Status::Ok;
}

InstrumentProfile rectangle_profile(std::string name, double width_arcsec, double height_arcsec) {
  return InstrumentProfile{.name = std::move(name), .polygons = {rect(0.0, 0.0, width_arcsec, height_arcsec)}};
}

InstrumentProfile circle_profile(std::string name, double radius_arcsec, std::size_t segments) {
  segments = std::max<std::size_t>(segments, 8U);
  Polygon poly;
  poly.reserve(segments);
  for (std::size_t i = 0; i < segments; ++i) {
    const double th = core::constants::kTwoPi * static_cast<double>(i) / static_cast<double>(segments);
    poly.push_back(PlanePoint{radius_arcsec * std::sin(th), radius_arcsec * std::cos(th)});
  }
  return InstrumentProfile{.name = std::move(name), .polygons = {std::move(poly)}};
}

InstrumentProfile mosaic_profile(std::string name,
                                 std::size_t cols,
                                 std::size_t rows,
                                 double ccd_w_arcsec,
                                 double ccd_h_arcsec,
                                 double gap_arcsec) {
  InstrumentProfile out{.name = std::move(name)};
  const double total_w = static_cast<double>(cols) * ccd_w_arcsec + static_cast<double>(cols > 0 ? cols - 1 : 0) * gap_arcsec;
  const double total_h = static_cast<double>(rows) * ccd_h_arcsec + static_cast<double>(rows > 0 ? rows - 1 : 0) * gap_arcsec;
  for (std::size_t r = 0; r < rows; ++r) {
    for (std::size_t c = 0; c < cols; ++c) {
      const double cx = -0.5 * total_w + (static_cast<double>(c) + 0.5) * ccd_w_arcsec + static_cast<double>(c) * gap_arcsec;
      const double cy = -0.5 * total_h + (static_cast<double>(r) + 0.5) * ccd_h_arcsec + static_cast<double>(r) * gap_arcsec;
      out.polygons.push_back(rect(cx, cy, ccd_w_arcsec, ccd_h_arcsec));
    }
  }
  return out;
}

const std::vector<InstrumentProfile>& builtin_instruments() {
  static const std::vector<InstrumentProfile> profiles = {
      rectangle_profile("square10", 600.0, 600.0),
      rectangle_profile("moircs", 240.0, 420.0),
      circle_profile("focas", 180.0),
      circle_profile("hsc", 2700.0, 120),
      mosaic_profile("spcam", 5, 2, 409.6, 819.2, 16.0),
  };
  return profiles;
}

const InstrumentProfile* find_instrument(const std::string& name) {
  const auto& all = builtin_instruments();
  const auto it = std::find_if(all.begin(), all.end(), [&name](const InstrumentProfile& p) { return p.name == name; });
  return (it == all.end()) ? nullptr : &*it;
}

std::optional<PlanePoint> project(const core::Equatorial& center, const core::Equatorial& p) {
  const TangentBasis b = tangent_basis(center);
  const Eigen::Vector3d u = unit(p);
  const double cos_c = u.dot(b.p0);
  if (cos_c <= 1.0e-12) {
    return std::nullopt;
  }
  const double arcsec_per_rad = 1.0 / kArcsecToRad;
  return PlanePoint{u.dot(b.east) / cos_c * arcsec_per_rad, u.dot(b.north) / cos_c * arcsec_per_rad};
}

core::Equatorial deproject(const core::Equatorial& center, const PlanePoint& p) {
  const TangentBasis b = tangent_basis(center);
  const Eigen::Vector3d u = (b.p0 + p.x_arcsec * kArcsecToRad * b.east + p.y_arcsec * kArcsecToRad * b.north).normalized();
  const auto ang = core::spherical_angles(core::Vec3{u.x(), u.y(), u.z()});
  return core::Equatorial{.ra_deg = ang[0] * kRadToDeg, .dec_deg = ang[1] * kRadToDeg};
}

bool point_in_polygon(const Polygon& polygon, const PlanePoint& p) {
  bool inside = false;
  const std::size_t n = polygon.size();
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const PlanePoint& a = polygon[i];
    const PlanePoint& b = polygon[j];
    if ((a.y_arcsec > p.y_arcsec) != (b.y_arcsec > p.y_arcsec)) {
      const double x_cross = a.x_arcsec + (p.y_arcsec - a.y_arcsec) * (b.x_arcsec - a.x_arcsec) / (b.y_arcsec - a.y_arcsec);
      if (p.x_arcsec < x_cross) {
        inside = !inside;
      }
    }
  }
  return inside;
}

FootprintResult footprint_at(const InstrumentProfile& profile, const Pointing& pointing) {
  FootprintResult out{};
  if (validate_profile(profile) != core::Status::Ok || !std::isfinite(pointing.pa_deg)) {
    out.status = core::Status::InvalidInput;
    return out;
  }
  const auto& c = pointing.center;
  if (!std::isfinite(c.ra_deg) || !std::isfinite(c.dec_deg) || c.dec_deg < -90.0 || c.dec_deg > 90.0) {
    out.status = core::Status::InvalidTarget;
    return out;
  }
  // Position angle turns the instrument +y axis from north toward east.
  const Eigen::Rotation2Dd rot(-pointing.pa_deg * kDegToRad);
  out.footprint.instrument = profile.name;
  out.footprint.pointing = pointing;
  out.footprint.plane.reserve(profile.polygons.size());
  out.footprint.sky.reserve(profile.polygons.size());
  for (const auto& poly : profile.polygons) {
    Polygon placed;
    std::vector<core::Equatorial> sky;
    placed.reserve(poly.size());
    sky.reserve(poly.size());
    for (const auto& v : poly) {
      const Eigen::Vector2d r = rot * Eigen::Vector2d(v.x_arcsec, v.y_arcsec);
      placed.push_back(PlanePoint{r.x(), r.y()});
      sky.push_back(deproject(c, placed.back()));
    }
    out.footprint.plane.push_back(std::move(placed));
    out.footprint.sky.push_back(std::move(sky));
  }
  return out;
}

bool contains(const FOVFootprint& footprint, const core::Equatorial& p) {
  const auto q = project(footprint.pointing.center, p);
  if (!q) {
    return false;
  }
  return std::any_of(footprint.plane.begin(), footprint.plane.end(),
                     [&q](const Polygon& poly) { return point_in_polygon(poly, *q); });
}

std::vector<std::string> targets_in_footprint(const FOVFootprint& footprint, const std::vector<catalog::Target>& targets) {
  std::vector<std::string> ids;
  for (const auto& t : targets) {
    if (contains(footprint, t.position)) {
      ids.push_back(t.id);
    }
  }
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

}  // namespace obsplan::fov
