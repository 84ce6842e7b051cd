/**
 * @file site.cpp
 * @brief Site model and site-level transform implementation.
 * @author Watosn
 */

#include "obsplan/site/site.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>

#include "obsplan/core/math_utils.hpp"
#include "obsplan/core/text_utils.hpp"
#include "obsplan/core/time_utils.hpp"

namespace obsplan::site {
namespace {

constexpr double kMinElevationM = -500.0;
constexpr double kMaxElevationM = 9000.0;

bool parse_number(const std::string& text, double& value) {
  return core::parse_double(text, value) && std::isfinite(value);
}

}  // namespace

std::optional<HorizonProfile> HorizonProfile::FromPoints(std::vector<HorizonPoint> points) {
  for (auto& p : points) {
    if (!std::isfinite(p.az_deg) || !std::isfinite(p.alt_deg) || p.alt_deg < -90.0 || p.alt_deg > 90.0) {
      return std::nullopt;
    }
    p.az_deg = core::wrap_360(p.az_deg);
  }
  std::sort(points.begin(), points.end(), [](const HorizonPoint& a, const HorizonPoint& b) { return a.az_deg < b.az_deg; });
  return HorizonProfile(std::move(points));
}

std::optional<HorizonProfile> HorizonProfile::Parse(const std::string& text) {
  std::vector<HorizonPoint> points;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ';')) {
    if (item.empty()) {
      continue;
    }
    const auto colon = item.find(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    HorizonPoint p{};
    if (!parse_number(item.substr(0, colon), p.az_deg) || !parse_number(item.substr(colon + 1), p.alt_deg)) {
      return std::nullopt;
    }
    points.push_back(p);
  }
  return FromPoints(std::move(points));
}

double HorizonProfile::min_altitude_deg(double az_deg) const {
  if (points_.empty()) {
    return 0.0;
  }
  if (points_.size() == 1U) {
    return points_.front().alt_deg;
  }
  const double az = core::wrap_360(az_deg);
  // First vertex strictly after `az`; wrap to the front past the last vertex.
  auto next = std::upper_bound(points_.begin(), points_.end(), az,
                               [](double a, const HorizonPoint& p) { return a < p.az_deg; });
  const HorizonPoint& hi = (next == points_.end()) ? points_.front() : *next;
  const HorizonPoint& lo = (next == points_.begin()) ? points_.back() : *std::prev(next);

  double span = hi.az_deg - lo.az_deg;
  double offset = az - lo.az_deg;
  if (span <= 0.0) {
    span += 360.0;
  }
  if (offset < 0.0) {
    offset += 360.0;
  }
  return lo.alt_deg + (hi.alt_deg - lo.alt_deg) * offset / span;
}

double HorizonProfile::max_altitude_deg() const {
  double out = 0.0;
  for (const auto& p : points_) {
    out = std::max(out, p.alt_deg);
  }
  return out;
}

core::Status validate_site(const Site& site) {
  const auto& loc = site.location;
  if (site.id.empty() || !std::isfinite(loc.lat_deg) || !std::isfinite(loc.lon_deg) || !std::isfinite(loc.alt_m)) {
    return core::Status::InvalidSite;
  }
  if (loc.lat_deg < -90.0 || loc.lat_deg > 90.0 || loc.lon_deg < -180.0 || loc.lon_deg > 360.0) {
    return core::Status::InvalidSite;
  }
  if (loc.alt_m < kMinElevationM || loc.alt_m > kMaxElevationM) {
    return core::Status::InvalidSite;
  }
  if (!std::isfinite(site.timezone_hours) || std::abs(site.timezone_hours) > 14.0 || !std::isfinite(site.dut1_s)
      || std::abs(site.dut1_s) > 1.0) {
    return core::Status::InvalidSite;
  }
  return core::Status::Ok;
}

bool valid_radec(const core::Equatorial& radec) {
  return std::isfinite(radec.ra_deg) && std::isfinite(radec.dec_deg) && radec.ra_deg >= 0.0 && radec.ra_deg < 360.0
         && radec.dec_deg >= -90.0 && radec.dec_deg <= 90.0;
}

FrameResult frame_state(const Site& site, const core::Epoch& t) {
  const core::Status s = core::validate_epoch(t.utc_seconds);
  if (s != core::Status::Ok) {
    return FrameResult{.status = s};
  }
  return FrameResult{.frame = core::build_frame_state(t.utc_seconds, site.dut1_s), .status = core::Status::Ok};
}

AngleResult local_sidereal_time(const Site& site, const core::Epoch& t) {
  if (validate_site(site) != core::Status::Ok) {
    return AngleResult{.status = core::Status::InvalidSite};
  }
  const auto fr = frame_state(site, t);
  if (fr.status != core::Status::Ok) {
    return AngleResult{.status = fr.status};
  }
  return AngleResult{.deg = core::local_sidereal_time_rad(fr.frame, site.location.lon_deg) * core::constants::kRadToDeg,
                     .status = core::Status::Ok};
}

core::HorizontalResult equatorial_to_horizontal(const Site& site, const core::Epoch& t, const core::Equatorial& radec) {
  if (validate_site(site) != core::Status::Ok) {
    return core::HorizontalResult{.status = core::Status::InvalidSite};
  }
  if (!valid_radec(radec)) {
    return core::HorizontalResult{.status = core::Status::InvalidTarget};
  }
  const auto fr = frame_state(site, t);
  if (fr.status != core::Status::Ok) {
    return core::HorizontalResult{.status = fr.status};
  }
  return core::equatorial_to_horizontal(fr.frame, site.location, radec, site.refraction);
}

core::EquatorialResult horizontal_to_equatorial(const Site& site, const core::Epoch& t, const core::Horizontal& altaz) {
  if (validate_site(site) != core::Status::Ok) {
    return core::EquatorialResult{.status = core::Status::InvalidSite};
  }
  if (!std::isfinite(altaz.alt_deg) || !std::isfinite(altaz.az_deg) || std::abs(altaz.alt_deg) > 90.0) {
    return core::EquatorialResult{.status = core::Status::InvalidInput};
  }
  const auto fr = frame_state(site, t);
  if (fr.status != core::Status::Ok) {
    return core::EquatorialResult{.status = fr.status};
  }
  return core::horizontal_to_equatorial(fr.frame, site.location, altaz, site.refraction);
}

std::string local_time_iso(const Site& site, const core::Epoch& t) {
  return core::format_iso8601(t.utc_seconds, site.timezone_hours);
}

}  // namespace obsplan::site
