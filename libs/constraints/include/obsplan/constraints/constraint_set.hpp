/**
 * @file constraint_set.hpp
 * @brief Immutable conjunction of constraints.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <vector>

#include "obsplan/constraints/constraint.hpp"

namespace obsplan::constraints {

/**
 * @brief Conjunction of constraints; satisfied when every member is. An empty set always holds.
 */
class ConstraintSet final {
 public:
  using Item = std::shared_ptr<const IConstraint>;

  ConstraintSet() = default;
  /// Null entries are dropped.
  explicit ConstraintSet(std::vector<Item> items);

  /**
   * @brief Copy of this set with one more member.
   */
  [[nodiscard]] ConstraintSet with(Item item) const;

  [[nodiscard]] const std::vector<Item>& items() const { return items_; }
  [[nodiscard]] bool empty() const { return items_.empty(); }
  [[nodiscard]] std::size_t size() const { return items_.size(); }
  [[nodiscard]] bool has_target_independent() const;

  /**
   * @brief Smallest member margin; +inf for an empty set, NaN as soon as a member yields NaN.
   */
  [[nodiscard]] double margin(const EvaluationContext& ctx) const;
  [[nodiscard]] bool satisfied(const EvaluationContext& ctx) const { return margin(ctx) >= 0.0; }
  [[nodiscard]] std::vector<ConstraintKind> failing(const EvaluationContext& ctx) const;

  /**
   * @brief Sorted, de-duplicated union of member crossings.
   *
   * `shared` supplies precomputed crossings of the target-independent members (see
   * `target_independent_crossings`); those members are then skipped.
   */
  [[nodiscard]] CrossingResult boundary_crossings(const catalog::Target& target,
                                                  const ephem::SkyStateCache& sky,
                                                  const core::TimeSpec& span,
                                                  const CrossingOptions& options,
                                                  const CrossingResult* shared = nullptr) const;

  /**
   * @brief Crossings of the members that ignore the target, computed once per batch.
   */
  [[nodiscard]] CrossingResult target_independent_crossings(const ephem::SkyStateCache& sky,
                                                            const core::TimeSpec& span,
                                                            const CrossingOptions& options) const;

 private:
  std::vector<Item> items_{};
};

/**
 * @brief Point evaluation result.
 */
struct EvaluateResult {
  bool satisfied{};
  std::vector<ConstraintKind> failing{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Evaluate a set for one target at one epoch; fails with `InvalidSite`, `InvalidTarget` or `InvalidTime`.
 */
[[nodiscard]] EvaluateResult evaluate(const ConstraintSet& set,
                                      const catalog::Target& target,
                                      const site::Site& site,
                                      const core::Epoch& t);

/**
 * @brief Crossings of one constraint over a time range without a caller-owned cache.
 */
[[nodiscard]] CrossingResult boundary_crossings(const IConstraint& constraint,
                                                const catalog::Target& target,
                                                const site::Site& site,
                                                const core::TimeSpec& span,
                                                const CrossingOptions& options = {});

}  // namespace obsplan::constraints
