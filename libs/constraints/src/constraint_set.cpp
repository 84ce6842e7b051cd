/**
 * @file constraint_set.cpp
 * @brief Constraint conjunction implementation.
 * @author Watosn
 */

#include "obsplan/constraints/constraint_set.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include "obsplan/constraints/crossing_finder.hpp"
#include "obsplan/core/time_utils.hpp"

namespace obsplan::constraints {
namespace {

void merge_into(CrossingResult& out, const CrossingResult& part) {
  out.times.insert(out.times.end(), part.times.begin(), part.times.end());
  out.unresolved.insert(out.unresolved.end(), part.unresolved.begin(), part.unresolved.end());
  if (part.status != core::Status::Ok) {
    out.status = part.status;
  }
}

// Stand-in for target-independent evaluations; its position is never read.
const catalog::Target& placeholder_target() {
  static const catalog::Target target{.id = "sky"};
  return target;
}

}  // namespace

ConstraintSet::ConstraintSet(std::vector<Item> items) {
  items_.reserve(items.size());
  for (auto& item : items) {
    if (item) {
      items_.push_back(std::move(item));
    }
  }
}

ConstraintSet ConstraintSet::with(Item item) const {
  std::vector<Item> items = items_;
  items.push_back(std::move(item));
  return ConstraintSet(std::move(items));
}

bool ConstraintSet::has_target_independent() const {
  return std::any_of(items_.begin(), items_.end(), [](const Item& c) { return c->target_independent(); });
}

double ConstraintSet::margin(const EvaluationContext& ctx) const {
  double m = std::numeric_limits<double>::infinity();
  for (const auto& c : items_) {
    const double cm = c->margin(ctx);
    if (std::isnan(cm)) {
      return cm;
    }
    m = std::min(m, cm);
  }
  return m;
}

std::vector<ConstraintKind> ConstraintSet::failing(const EvaluationContext& ctx) const {
  std::vector<ConstraintKind> out;
  for (const auto& c : items_) {
    if (!c->satisfied(ctx)) {
      out.push_back(c->kind());
    }
  }
  return out;
}

CrossingResult ConstraintSet::boundary_crossings(const catalog::Target& target,
                                                 const ephem::SkyStateCache& sky,
                                                 const core::TimeSpec& span,
                                                 const CrossingOptions& options,
                                                 const CrossingResult* shared) const {
  CrossingResult out{};
  if (shared != nullptr) {
    merge_into(out, *shared);
  }
  for (const auto& c : items_) {
    if (shared != nullptr && c->target_independent()) {
      continue;
    }
    merge_into(out, c->boundary_crossings(target, sky, span, options));
  }
  normalize_crossings(out.times, options.tolerance_s);
  return out;
}

CrossingResult ConstraintSet::target_independent_crossings(const ephem::SkyStateCache& sky,
                                                           const core::TimeSpec& span,
                                                           const CrossingOptions& options) const {
  CrossingResult out{};
  for (const auto& c : items_) {
    if (c->target_independent()) {
      merge_into(out, c->boundary_crossings(placeholder_target(), sky, span, options));
    }
  }
  normalize_crossings(out.times, options.tolerance_s);
  return out;
}

EvaluateResult evaluate(const ConstraintSet& set, const catalog::Target& target, const site::Site& site, const core::Epoch& t) {
  EvaluateResult out{};
  if (site::validate_site(site) != core::Status::Ok) {
    out.status = core::Status::InvalidSite;
    return out;
  }
  if (catalog::validate_target(target) != core::Status::Ok) {
    out.status = core::Status::InvalidTarget;
    return out;
  }
  if (core::validate_epoch(t.utc_seconds) != core::Status::Ok) {
    out.status = core::Status::InvalidTime;
    return out;
  }
  const ephem::SkySample sky = ephem::sky_sample(site, t.utc_seconds);
  const EvaluationContext ctx{.target = target, .site = site, .sky = sky, .state = target_state(target, site, sky)};
  out.failing = set.failing(ctx);
  out.satisfied = out.failing.empty();
  return out;
}

CrossingResult boundary_crossings(const IConstraint& constraint,
                                  const catalog::Target& target,
                                  const site::Site& site,
                                  const core::TimeSpec& span,
                                  const CrossingOptions& options) {
  if (catalog::validate_target(target) != core::Status::Ok) {
    return CrossingResult{.status = core::Status::InvalidTarget};
  }
  core::Status st = core::Status::Ok;
  const auto sky = ephem::SkyStateCache::Create(site, span, &st);
  if (!sky) {
    return CrossingResult{.status = st};
  }
  return constraint.boundary_crossings(target, *sky, span, options);
}

}  // namespace obsplan::constraints
