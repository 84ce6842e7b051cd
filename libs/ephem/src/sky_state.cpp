/**
 * @file sky_state.cpp
 * @brief Shared sky-state cache implementation.
 * @author Watosn
 */

#include "obsplan/ephem/sky_state.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "obsplan/core/math_utils.hpp"
#include "obsplan/core/time_utils.hpp"

namespace obsplan::ephem {
namespace {

core::Vec3 lerp_direction(const core::Vec3& a, const core::Vec3& b, double w) {
  return core::normalized((1.0 - w) * a + w * b);
}

void set_status(core::Status* out, core::Status s) {
  if (out != nullptr) {
    *out = s;
  }
}

void finish(const site::Site& site, SkySample& s) {
  s.lst_rad = core::local_sidereal_time_rad(s.frame, site.location.lon_deg);
  s.sun = direction_to_horizontal(s.sun_moon.sun_dir, s.lst_rad, site.location);
  s.sun.alt_deg += core::refraction_deg(s.sun.alt_deg, site.refraction);
  s.moon = direction_to_horizontal(s.sun_moon.moon_dir, s.lst_rad, site.location);
  s.moon.alt_deg += core::refraction_deg(s.moon.alt_deg, site.refraction);
}

}  // namespace

SkySample sky_sample(const site::Site& site, double utc_seconds) {
  SkySample s{};
  s.utc_seconds = utc_seconds;
  s.frame = core::build_frame_state(utc_seconds, site.dut1_s);
  s.sun_moon = sun_moon_state(s.frame, site.location);
  finish(site, s);
  return s;
}

std::unique_ptr<SkyStateCache> SkyStateCache::Create(const site::Site& site,
                                                     const core::TimeSpec& span,
                                                     const Config& config,
                                                     core::Status* status) {
  if (site::validate_site(site) != core::Status::Ok) {
    set_status(status, core::Status::InvalidSite);
    return nullptr;
  }
  if (!(span.end.utc_seconds > span.start.utc_seconds) || !(span.step_s > 0.0)) {
    set_status(status, core::Status::InvalidInput);
    return nullptr;
  }
  if (core::validate_epoch(span.start.utc_seconds) != core::Status::Ok
      || core::validate_epoch(span.end.utc_seconds) != core::Status::Ok) {
    set_status(status, core::Status::InvalidTime);
    return nullptr;
  }

  const double step = std::clamp(span.step_s, config.min_step_s, config.max_step_s);
  auto out = std::unique_ptr<SkyStateCache>(new SkyStateCache(site, span, step));
  const auto n = static_cast<std::size_t>(std::ceil(span.duration_s() / step)) + 1U;
  out->samples_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const double t = std::min(span.start.utc_seconds + static_cast<double>(i) * step, span.end.utc_seconds);
    out->samples_.push_back(sky_sample(site, t));
  }
  spdlog::debug("sky cache for site '{}': {} samples at {:.0f} s", site.id, out->samples_.size(), step);
  set_status(status, core::Status::Ok);
  return out;
}

SkySample SkyStateCache::at(double utc_seconds) const {
  if (samples_.empty() || utc_seconds < samples_.front().utc_seconds || utc_seconds > samples_.back().utc_seconds) {
    return sky_sample(site_, utc_seconds);
  }
  const double x = (utc_seconds - span_.start.utc_seconds) / step_s_;
  const auto i = std::min(static_cast<std::size_t>(std::floor(x)), samples_.size() - 1U);
  const SkySample& a = samples_[i];
  if (utc_seconds == a.utc_seconds || i + 1U >= samples_.size()) {
    return a;
  }
  const SkySample& b = samples_[i + 1U];
  const double w = (utc_seconds - a.utc_seconds) / (b.utc_seconds - a.utc_seconds);

  SkySample s{};
  s.utc_seconds = utc_seconds;
  s.frame = core::build_frame_state(utc_seconds, site_.dut1_s);
  s.sun_moon = SunMoonState{
      .sun_dir = lerp_direction(a.sun_moon.sun_dir, b.sun_moon.sun_dir, w),
      .moon_dir = lerp_direction(a.sun_moon.moon_dir, b.sun_moon.moon_dir, w),
      .moon_distance_km = (1.0 - w) * a.sun_moon.moon_distance_km + w * b.sun_moon.moon_distance_km,
      .moon_illuminated_fraction = (1.0 - w) * a.sun_moon.moon_illuminated_fraction + w * b.sun_moon.moon_illuminated_fraction,
  };
  finish(site_, s);
  return s;
}

}  // namespace obsplan::ephem
