/**
 * @file planner.hpp
 * @brief Target ranking and slot booking from observability windows.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "obsplan/catalog/target.hpp"
#include "obsplan/fov/footprint.hpp"
#include "obsplan/visibility/window.hpp"

namespace obsplan::planner {

/**
 * @brief Target score; higher ranks first.
 */
enum class Scoring : std::uint8_t { PriorityWeighted, TotalVisibleTime, MaxAltitude, EarliestWindow };

/**
 * @brief How overlapping requests at one site are resolved.
 */
enum class ConflictRule : std::uint8_t { SingleTelescope, AllowOverlap };

[[nodiscard]] std::string_view to_string(Scoring scoring);
[[nodiscard]] std::optional<Scoring> parse_scoring(std::string_view text);
[[nodiscard]] std::string_view to_string(ConflictRule rule);
[[nodiscard]] std::optional<ConflictRule> parse_conflict_rule(std::string_view text);

struct PlanPolicy {
  Scoring scoring{Scoring::PriorityWeighted};
  ConflictRule conflict{ConflictRule::SingleTelescope};
  /// Slot length for targets without a requested exposure; 0 books the whole window.
  double default_slot_s{0.0};
  /// When set, targets inside the footprint of a booked pointing share its slot.
  std::optional<fov::InstrumentProfile> instrument{};
  double pa_deg{0.0};
};

/**
 * @brief One booked observation.
 *
 * `co_observed_with` names the target whose pointing covers this one; such entries share that slot.
 */
struct PlanEntry {
  std::string target_id{};
  std::string site_id{};
  std::size_t rank{};
  double score{};
  double slot_start_utc_s{};
  double slot_end_utc_s{};
  visibility::ObservabilityWindow window{};
  std::optional<fov::Pointing> pointing{};
  std::string co_observed_with{};
  /// Booked later than its first window start because of a conflict.
  bool deferred{false};
};

/**
 * @brief Entries ordered by slot start; `unscheduled` in rank order, then targets without windows in input order.
 */
struct Plan {
  std::vector<PlanEntry> entries{};
  std::vector<std::string> unscheduled{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Score of one target's windows under a scoring rule.
 */
[[nodiscard]] double score(Scoring scoring, const catalog::Target& target, const std::vector<visibility::ObservabilityWindow>& windows);

/**
 * @brief Rank targets and book slots.
 *
 * Ties in score fall back to the earliest window start, then the target id. Identical inputs
 * always produce an identical plan.
 */
[[nodiscard]] Plan rank(const std::vector<catalog::Target>& targets,
                        const std::vector<visibility::ObservabilityWindow>& windows,
                        const PlanPolicy& policy);

/**
 * @brief One row per entry, header line first.
 */
[[nodiscard]] std::string plan_to_csv(const Plan& plan);

}  // namespace obsplan::planner
