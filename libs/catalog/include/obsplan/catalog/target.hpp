/**
 * @file target.hpp
 * @brief Normalized target records and the catalog that owns them.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "obsplan/core/types.hpp"

namespace obsplan::constraints {
class ConstraintSet;
}

namespace obsplan::catalog {

/**
 * @brief Celestial target. Never mutated by computations.
 */
struct Target {
  std::string id{};
  std::string name{};
  /// Mean place, ICRS/J2000 axes, at `epoch_jyear`.
  core::Equatorial position{};
  double epoch_jyear{2000.0};
  /// Proper motion in RA (includes cos(dec)) and Dec, mas/yr.
  double pm_ra_mas_yr{};
  double pm_dec_mas_yr{};
  double priority{1.0};
  std::optional<double> exposure_s{};
  std::string category{};
  /// Replaces the batch constraint set for this target when present.
  std::shared_ptr<const constraints::ConstraintSet> constraints{};
};

/**
 * @brief Validate coordinates and metadata; `InvalidTarget` when malformed.
 */
[[nodiscard]] core::Status validate_target(const Target& target);

/**
 * @brief Mean J2000 position propagated by proper motion to a UTC epoch.
 */
[[nodiscard]] core::Equatorial position_at(const Target& target, double utc_seconds);

/**
 * @brief Owning collection of targets, unique by id, in insertion order.
 */
class Catalog final {
 public:
  Catalog() = default;

  /**
   * @brief Add a target; `InvalidTarget` when malformed, `InvalidInput` for a duplicate id.
   */
  [[nodiscard]] core::Status add(Target target);

  [[nodiscard]] const Target* find(const std::string& id) const;
  [[nodiscard]] const std::vector<Target>& targets() const { return targets_; }
  [[nodiscard]] std::size_t size() const { return targets_.size(); }
  [[nodiscard]] bool empty() const { return targets_.empty(); }

 private:
  std::vector<Target> targets_{};
};

}  // namespace obsplan::catalog
