/**
 * @file dither.cpp
 * @brief Dither pattern implementation.
 * @author Watosn
 */

#include "obsplan/fov/dither.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include <Eigen/Dense>

#include "obsplan/core/constants.hpp"

namespace obsplan::fov {
namespace {

constexpr std::array<std::array<double, 2>, 5> kCross5 = {{{0.0, 0.0}, {1.0, -2.0}, {2.0, 1.0}, {-1.0, 2.0}, {-2.0, -1.0}}};

Pointing offset(const Pointing& center, const Eigen::Rotation2Dd& rot, double dx, double dy) {
  const Eigen::Vector2d r = rot * Eigen::Vector2d(dx, dy);
  return Pointing{.center = deproject(center.center, PlanePoint{r.x(), r.y()}), .pa_deg = center.pa_deg};
}

}  // namespace

std::string_view to_string(DitherPattern pattern) {
  switch (pattern) {
    case DitherPattern::Single:
      return "single";
    case DitherPattern::Cross5:
      return "cross5";
    case DitherPattern::Circular:
      return "circular";
  }
  return "unknown";
}

std::optional<DitherPattern> parse_dither_pattern(std::string_view text) {
  for (const DitherPattern p : {DitherPattern::Single, DitherPattern::Cross5, DitherPattern::Circular}) {
    if (text == to_string(p)) {
      return p;
    }
  }
  return std::nullopt;
}

std::vector<Pointing> dither_pointings(const Pointing& center, DitherPattern pattern, std::size_t n, double step_arcsec) {
  const Eigen::Rotation2Dd rot(-center.pa_deg * core::constants::kDegToRad);
  std::vector<Pointing> out;
  switch (pattern) {
    case DitherPattern::Single:
      out.push_back(center);
      break;
    case DitherPattern::Cross5:
      for (const auto& d : kCross5) {
        out.push_back(offset(center, rot, d[0] * step_arcsec, d[1] * step_arcsec));
      }
      break;
    case DitherPattern::Circular: {
      n = std::max<std::size_t>(n, 1U);
      for (std::size_t k = 0; k < n; ++k) {
        const double th = core::constants::kTwoPi * static_cast<double>(k) / static_cast<double>(n);
        out.push_back(offset(center, rot, step_arcsec * std::sin(th), step_arcsec * std::cos(th)));
      }
      break;
    }
  }
  return out;
}

std::size_t coverage_count(const std::vector<FOVFootprint>& footprints, const core::Equatorial& p) {
  return static_cast<std::size_t>(
      std::count_if(footprints.begin(), footprints.end(), [&p](const FOVFootprint& f) { return contains(f, p); }));
}

bool union_contains(const std::vector<FOVFootprint>& footprints, const core::Equatorial& p) {
  return std::any_of(footprints.begin(), footprints.end(), [&p](const FOVFootprint& f) { return contains(f, p); });
}

}  // namespace obsplan::fov
