/**
 * @file crossing_finder.hpp
 * @brief Sign-change scanning and bisection refinement for margin functions of time.
 * @author Watosn
 */
#pragma once

#include <functional>
#include <optional>

#include "obsplan/constraints/constraint.hpp"

namespace obsplan::constraints {

using MarginFunction = std::function<double(double utc_seconds)>;

/**
 * @brief Outcome of refining one bracket.
 */
struct RefineResult {
  double time{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Bisect `[a, b]`, where `margin(a) >= 0` differs from `margin(b) >= 0`, down to the tolerance.
 *
 * Fails with `NumericNonConvergence` when the budget runs out or the margin is not finite.
 */
[[nodiscard]] RefineResult refine_crossing(const MarginFunction& margin, double a, double b, const CrossingOptions& options);

/**
 * @brief Scan `[t0, t1]` at `step_s`, refining every sign change.
 */
[[nodiscard]] CrossingResult find_crossings(const MarginFunction& margin,
                                            double t0,
                                            double t1,
                                            double step_s,
                                            const CrossingOptions& options);

/**
 * @brief Refine around a predicted crossing: looks for a sign change in `[seed - half_width, seed + half_width]`.
 *
 * Returns nullopt when the bracket shows no sign change.
 */
[[nodiscard]] std::optional<RefineResult> refine_seed(const MarginFunction& margin,
                                                      double seed,
                                                      double half_width_s,
                                                      double t0,
                                                      double t1,
                                                      const CrossingOptions& options);

/**
 * @brief Sort and merge times closer than `tolerance_s`.
 */
void normalize_crossings(std::vector<double>& times, double tolerance_s);

}  // namespace obsplan::constraints
