/**
 * @file defaults.hpp
 * @brief Per-instrument/site default constraint thresholds, loadable from a profile file.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>

#include "obsplan/constraints/constraint_set.hpp"

namespace obsplan::constraints {

/**
 * @brief Default thresholds; an unset optional disables that constraint.
 */
struct ConstraintDefaults {
  double min_elevation_deg{15.0};
  double max_elevation_deg{90.0};
  bool use_horizon{true};
  std::optional<double> max_airmass{};
  std::optional<double> min_moon_separation_deg{30.0};
  std::optional<double> max_moon_illumination{};
  /// Nautical twilight.
  std::optional<double> max_sun_altitude_deg{-12.0};
};

struct DefaultsResult {
  ConstraintDefaults defaults{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Parse `key = value` lines over `base`; `#` starts a comment.
 *
 * Keys: `min_elevation_deg`, `max_elevation_deg`, `use_horizon`, `max_airmass`,
 * `min_moon_separation_deg`, `max_moon_illumination`, `twilight` (sunset, civil, nautical,
 * astronomical or degrees). `off` clears an optional threshold. Unknown keys are skipped
 * with a warning; malformed values fail with `InvalidInput`.
 */
[[nodiscard]] DefaultsResult parse_constraint_defaults(std::istream& in, const ConstraintDefaults& base = {});

/**
 * @brief Load a profile file; `DataUnavailable` when it cannot be opened.
 */
[[nodiscard]] DefaultsResult load_constraint_defaults(const std::filesystem::path& path,
                                                      const ConstraintDefaults& base = {});

struct DefaultSetResult {
  ConstraintSet set{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Build the constraint set described by `defaults`; `InvalidInput` when a threshold is out of range.
 */
[[nodiscard]] DefaultSetResult make_default_set(const ConstraintDefaults& defaults);

}  // namespace obsplan::constraints
