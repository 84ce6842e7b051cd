/**
 * @file target.cpp
 * @brief Target validation, proper motion and catalog implementation.
 * @author Watosn
 */

#include "obsplan/catalog/target.hpp"

#include <algorithm>
#include <cmath>

#include "obsplan/core/constants.hpp"
#include "obsplan/core/math_utils.hpp"
#include "obsplan/core/time_utils.hpp"

namespace obsplan::catalog {
namespace {

constexpr double kMasToDeg = 1.0 / 3600000.0;
// Proper motion is meaningless this close to the pole in RA; clamp cos(dec).
constexpr double kMinCosDec = 1.0e-9;

}  // namespace

core::Status validate_target(const Target& target) {
  const auto& p = target.position;
  if (target.id.empty() || !std::isfinite(p.ra_deg) || !std::isfinite(p.dec_deg)) {
    return core::Status::InvalidTarget;
  }
  if (p.ra_deg < 0.0 || p.ra_deg >= 360.0 || p.dec_deg < -90.0 || p.dec_deg > 90.0) {
    return core::Status::InvalidTarget;
  }
  if (!std::isfinite(target.epoch_jyear) || !std::isfinite(target.pm_ra_mas_yr) || !std::isfinite(target.pm_dec_mas_yr)
      || !std::isfinite(target.priority) || target.priority < 0.0) {
    return core::Status::InvalidTarget;
  }
  if (target.exposure_s && !(*target.exposure_s > 0.0)) {
    return core::Status::InvalidTarget;
  }
  return core::Status::Ok;
}

core::Equatorial position_at(const Target& target, double utc_seconds) {
  if (target.pm_ra_mas_yr == 0.0 && target.pm_dec_mas_yr == 0.0) {
    return target.position;
  }
  const double dt_yr = core::utc_seconds_to_julian_year(utc_seconds) - target.epoch_jyear;
  const double cos_dec = std::max(std::cos(target.position.dec_deg * core::constants::kDegToRad), kMinCosDec);
  const double dec = std::clamp(target.position.dec_deg + target.pm_dec_mas_yr * kMasToDeg * dt_yr, -90.0, 90.0);
  const double ra = core::wrap_360(target.position.ra_deg + target.pm_ra_mas_yr * kMasToDeg * dt_yr / cos_dec);
  return core::Equatorial{.ra_deg = ra, .dec_deg = dec};
}

core::Status Catalog::add(Target target) {
  const core::Status st = validate_target(target);
  if (st != core::Status::Ok) {
    return st;
  }
  if (find(target.id) != nullptr) {
    return core::Status::InvalidInput;
  }
  targets_.push_back(std::move(target));
  return core::Status::Ok;
}

const Target* Catalog::find(const std::string& id) const {
  const auto it = std::find_if(targets_.begin(), targets_.end(), [&id](const Target& t) { return t.id == id; });
  return (it == targets_.end()) ? nullptr : &*it;
}

}  // namespace obsplan::catalog
