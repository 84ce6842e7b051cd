/**
 * @file constraint.hpp
 * @brief Observability constraint interface and evaluation context.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "obsplan/catalog/target.hpp"
#include "obsplan/core/types.hpp"
#include "obsplan/ephem/sky_state.hpp"
#include "obsplan/site/site.hpp"

namespace obsplan::constraints {

/**
 * @brief Constraint category identifier.
 */
enum class ConstraintKind : std::uint8_t { Elevation, Azimuth, Airmass, MoonSeparation, MoonIllumination, SunAltitude, Custom };

std::string_view to_string(ConstraintKind kind);

/**
 * @brief Target position derived for one epoch.
 */
struct TargetState {
  core::Equatorial mean{};
  /// Apparent unit vector, true equator and equinox of date.
  core::Vec3 apparent_dir{};
  core::Horizontal altaz{};
  double hour_angle_deg{};
};

/**
 * @brief Compute a target's state from the shared sky sample at the same epoch.
 */
[[nodiscard]] TargetState target_state(const catalog::Target& target, const site::Site& site, const ephem::SkySample& sky);

/**
 * @brief Inputs to one predicate evaluation.
 */
struct EvaluationContext {
  const catalog::Target& target;
  const site::Site& site;
  const ephem::SkySample& sky;
  TargetState state{};
};

/**
 * @brief Tuning for boundary-crossing searches.
 */
struct CrossingOptions {
  /// Bisection stops when the bracket is at most this wide.
  double tolerance_s{1.0};
  int max_iterations{64};
  /// Coarse scan step; 0 uses the time range's own step.
  double scan_step_s{0.0};
  /// Upper bound on the scan step, whatever the time range asks for. A truth flip and its
  /// return within one step are invisible to the scan.
  double max_scan_step_s{600.0};
};

/**
 * @brief Times at which a predicate's truth value flips, sorted ascending.
 *
 * `unresolved` lists brackets that could not be refined within budget; `status` is then
 * `NumericNonConvergence` and the caller is expected to sample those brackets densely.
 */
struct CrossingResult {
  std::vector<double> times{};
  std::vector<std::pair<double, double>> unresolved{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief One observability predicate.
 *
 * `margin` is >= 0 exactly when the constraint holds and should vary continuously with time
 * wherever the underlying geometry does, so that crossings can be bracketed by sign changes.
 */
class IConstraint {
 public:
  virtual ~IConstraint() = default;

  [[nodiscard]] virtual ConstraintKind kind() const = 0;
  [[nodiscard]] virtual std::string name() const = 0;
  [[nodiscard]] virtual double margin(const EvaluationContext& ctx) const = 0;

  /**
   * @brief True when the predicate ignores the target (Sun altitude, Moon illumination).
   */
  [[nodiscard]] virtual bool target_independent() const { return false; }

  [[nodiscard]] bool satisfied(const EvaluationContext& ctx) const { return margin(ctx) >= 0.0; }

  /**
   * @brief Flip times of this predicate within `span`; default is scan plus bisection.
   *
   * The default scan step is capped by `CrossingOptions::max_scan_step_s`.
   */
  [[nodiscard]] virtual CrossingResult boundary_crossings(const catalog::Target& target,
                                                          const ephem::SkyStateCache& sky,
                                                          const core::TimeSpec& span,
                                                          const CrossingOptions& options) const;
};

/**
 * @brief Margin of one constraint for `target` at `utc_seconds`, using the shared cache.
 */
[[nodiscard]] double margin_at(const IConstraint& constraint,
                               const catalog::Target& target,
                               const ephem::SkyStateCache& sky,
                               double utc_seconds);

}  // namespace obsplan::constraints
