/**
 * @file crossing_finder.cpp
 * @brief Crossing search implementation.
 * @author Watosn
 */

#include "obsplan/constraints/crossing_finder.hpp"

#include <algorithm>
#include <cmath>

namespace obsplan::constraints {
namespace {

bool holds(double m) { return m >= 0.0; }

}  // namespace

RefineResult refine_crossing(const MarginFunction& margin, double a, double b, const CrossingOptions& options) {
  const double ma = margin(a);
  const double mb = margin(b);
  if (std::isnan(ma) || std::isnan(mb) || holds(ma) == holds(mb)) {
    return RefineResult{.time = 0.5 * (a + b), .status = core::Status::NumericNonConvergence};
  }
  const bool left_holds = holds(ma);
  for (int i = 0; i < options.max_iterations; ++i) {
    if (b - a <= options.tolerance_s) {
      return RefineResult{.time = 0.5 * (a + b), .status = core::Status::Ok};
    }
    const double mid = 0.5 * (a + b);
    const double mm = margin(mid);
    if (std::isnan(mm)) {
      break;
    }
    if (holds(mm) == left_holds) {
      a = mid;
    } else {
      b = mid;
    }
  }
  if (b - a <= options.tolerance_s) {
    return RefineResult{.time = 0.5 * (a + b), .status = core::Status::Ok};
  }
  return RefineResult{.time = 0.5 * (a + b), .status = core::Status::NumericNonConvergence};
}

CrossingResult find_crossings(const MarginFunction& margin,
                              double t0,
                              double t1,
                              double step_s,
                              const CrossingOptions& options) {
  CrossingResult out{};
  if (!(t1 > t0) || !(step_s > 0.0)) {
    return out;
  }
  double prev_t = t0;
  double prev_m = margin(t0);
  while (prev_t < t1) {
    const double t = std::min(prev_t + step_s, t1);
    const double m = margin(t);
    if (std::isnan(m) || std::isnan(prev_m)) {
      out.unresolved.emplace_back(prev_t, t);
      out.status = core::Status::NumericNonConvergence;
    } else if (holds(m) != holds(prev_m)) {
      const RefineResult r = refine_crossing(margin, prev_t, t, options);
      if (r.status == core::Status::Ok) {
        out.times.push_back(r.time);
      } else {
        out.unresolved.emplace_back(prev_t, t);
        out.status = core::Status::NumericNonConvergence;
      }
    }
    prev_t = t;
    prev_m = m;
  }
  return out;
}

std::optional<RefineResult> refine_seed(const MarginFunction& margin,
                                        double seed,
                                        double half_width_s,
                                        double t0,
                                        double t1,
                                        const CrossingOptions& options) {
  const double a = std::max(t0, seed - half_width_s);
  const double b = std::min(t1, seed + half_width_s);
  if (!(b > a)) {
    return std::nullopt;
  }
  const double ma = margin(a);
  const double mb = margin(b);
  if (std::isnan(ma) || std::isnan(mb)) {
    return RefineResult{.time = seed, .status = core::Status::NumericNonConvergence};
  }
  if (holds(ma) == holds(mb)) {
    return std::nullopt;
  }
  return refine_crossing(margin, a, b, options);
}

void normalize_crossings(std::vector<double>& times, double tolerance_s) {
  std::sort(times.begin(), times.end());
  std::vector<double> merged;
  merged.reserve(times.size());
  for (const double t : times) {
    if (merged.empty() || t - merged.back() > tolerance_s) {
      merged.push_back(t);
    }
  }
  times = std::move(merged);
}

}  // namespace obsplan::constraints
