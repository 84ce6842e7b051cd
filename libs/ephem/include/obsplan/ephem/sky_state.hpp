/**
 * @file sky_state.hpp
 * @brief Shared, read-only per-epoch sky state for one site and time range.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "obsplan/core/transforms.hpp"
#include "obsplan/core/types.hpp"
#include "obsplan/ephem/sun_moon.hpp"
#include "obsplan/site/site.hpp"

namespace obsplan::ephem {

/**
 * @brief Everything target-independent needed to evaluate constraints at one epoch.
 */
struct SkySample {
  double utc_seconds{};
  core::FrameState frame{};
  double lst_rad{};
  SunMoonState sun_moon{};
  core::Horizontal sun{};
  core::Horizontal moon{};
};

/**
 * @brief Exact sky state at one epoch for a site; no validation.
 */
[[nodiscard]] SkySample sky_sample(const site::Site& site, double utc_seconds);

/**
 * @brief Sun/Moon/frame samples for a (site, time range) pair.
 *
 * Built once per batch and shared read-only by every target computation, from any thread.
 * Queries between grid points interpolate Sun/Moon directions and recompute the frame exactly.
 */
class SkyStateCache final {
 public:
  /**
   * @brief Cache construction options.
   */
  struct Config {
    double max_step_s{600.0};
    double min_step_s{60.0};
  };

  /**
   * @brief Build the cache; nullptr with `status` set when the site or range is invalid.
   */
  static std::unique_ptr<SkyStateCache> Create(const site::Site& site,
                                               const core::TimeSpec& span,
                                               const Config& config,
                                               core::Status* status = nullptr);

  static std::unique_ptr<SkyStateCache> Create(const site::Site& site,
                                               const core::TimeSpec& span,
                                               core::Status* status = nullptr) {
    return Create(site, span, Config{}, status);
  }

  /**
   * @brief Sky state at an epoch; exact outside the cached grid.
   */
  [[nodiscard]] SkySample at(double utc_seconds) const;

  [[nodiscard]] const site::Site& site() const { return site_; }
  [[nodiscard]] const core::TimeSpec& span() const { return span_; }
  [[nodiscard]] const std::vector<SkySample>& samples() const { return samples_; }
  [[nodiscard]] double step_s() const { return step_s_; }

 private:
  SkyStateCache(site::Site site, core::TimeSpec span, double step_s)
      : site_(std::move(site)), span_(span), step_s_(step_s) {}


  site::Site site_{};
  core::TimeSpec span_{};
  double step_s_{};
  std::vector<SkySample> samples_{};
};

}  // namespace obsplan::ephem
