/**
 * @file test_planner.cpp
 * @brief Target ranking, slot booking and co-observation tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "obsplan/planner/planner.hpp"

namespace {

using namespace obsplan;

catalog::Target make_target(const char* id, double ra_deg, double dec_deg, double priority, std::optional<double> exposure_s = {}) {
  catalog::Target t{};
  t.id = id;
  t.position = core::Equatorial{.ra_deg = ra_deg, .dec_deg = dec_deg};
  t.priority = priority;
  t.exposure_s = exposure_s;
  return t;
}

visibility::ObservabilityWindow make_window(const char* id, double start, double end) {
  return visibility::ObservabilityWindow{.target_id = id,
                                         .site_id = "subaru",
                                         .start_utc_s = start,
                                         .end_utc_s = end,
                                         .max_alt_deg = 60.0,
                                         .max_alt_utc_s = 0.5 * (start + end),
                                         .min_airmass = 1.15};
}

const planner::PlanEntry* entry_for(const planner::Plan& plan, const std::string& id) {
  const auto it = std::find_if(plan.entries.begin(), plan.entries.end(), [&id](const planner::PlanEntry& e) { return e.target_id == id; });
  return (it == plan.entries.end()) ? nullptr : &*it;
}

}  // namespace

int main() {
  const double t0 = 1704844800.0;  // 2024-01-10T00:00:00Z

  // Equal scores: earliest window first, then id.
  const std::vector<catalog::Target> tied{
      make_target("c", 10.0, 10.0, 1.0),
      make_target("a", 40.0, 10.0, 1.0),
      make_target("b", 70.0, 10.0, 1.0),
  };
  const std::vector<visibility::ObservabilityWindow> tied_windows{
      make_window("c", t0 + 1000.0, t0 + 4000.0),
      make_window("a", t0 + 1000.0, t0 + 4000.0),
      make_window("b", t0 + 500.0, t0 + 4000.0),
  };
  const auto ties = planner::rank(tied, tied_windows, {.conflict = planner::ConflictRule::AllowOverlap});
  if (ties.status != core::Status::Ok || ties.entries.size() != 3U || ties.entries[0].target_id != "b" || ties.entries[0].rank != 1U
      || ties.entries[1].target_id != "a" || ties.entries[1].rank != 2U || ties.entries[2].target_id != "c") {
    spdlog::error("tie-break ordering mismatch");
    return 1;
  }

  const std::vector<catalog::Target> queue{
      make_target("none", 200.0, 20.0, 5.0, 600.0),
      make_target("late", 160.0, 20.0, 0.5, 2000.0),
      make_target("tight", 120.0, 20.0, 2.0, 3600.0),
      make_target("lo", 80.0, 20.0, 1.0, 3600.0),
      make_target("hi", 40.0, 20.0, 3.0, 3600.0),
  };
  const std::vector<visibility::ObservabilityWindow> queue_windows{
      make_window("hi", t0, t0 + 7200.0),
      make_window("lo", t0, t0 + 7200.0),
      make_window("tight", t0, t0 + 3000.0),
      make_window("late", t0, t0 + 5000.0),
  };
  const auto single = planner::rank(queue, queue_windows, {});
  const auto* hi = entry_for(single, "hi");
  const auto* lo = entry_for(single, "lo");
  if (single.status != core::Status::Ok || single.entries.size() != 2U || hi == nullptr || lo == nullptr || hi->rank != 1U
      || hi->slot_start_utc_s != t0 || hi->deferred || lo->slot_start_utc_s != t0 + 3600.0 || !lo->deferred) {
    spdlog::error("single-telescope booking mismatch");
    return 2;
  }
  // Rank order for the unplaced, then targets that never had a window.
  if (single.unscheduled != std::vector<std::string>{"tight", "late", "none"}) {
    spdlog::error("unscheduled ordering mismatch ({} entries)", single.unscheduled.size());
    return 3;
  }

  const auto overlap = planner::rank(queue, queue_windows, {.conflict = planner::ConflictRule::AllowOverlap});
  if (overlap.entries.size() != 3U || std::any_of(overlap.entries.begin(), overlap.entries.end(), [t0](const planner::PlanEntry& e) {
        return e.slot_start_utc_s != t0 || e.deferred;
      })) {
    spdlog::error("overlapping bookings mismatch");
    return 4;
  }

  const auto whole = planner::rank({make_target("free", 10.0, 0.0, 1.0)}, {make_window("free", t0, t0 + 5400.0)}, {});
  const auto fixed = planner::rank({make_target("free", 10.0, 0.0, 1.0)}, {make_window("free", t0, t0 + 5400.0)}, {.default_slot_s = 900.0});
  if (whole.entries.size() != 1U || whole.entries[0].slot_end_utc_s != t0 + 5400.0 || fixed.entries.size() != 1U
      || fixed.entries[0].slot_end_utc_s != t0 + 900.0) {
    spdlog::error("slot length mismatch");
    return 5;
  }

  // A close neighbour rides along in the pointing of the higher-ranked target.
  const std::vector<catalog::Target> field{
      make_target("E", 150.0, 30.0, 2.0, 1800.0),
      make_target("F", 150.02, 30.0, 1.0, 1800.0),
      make_target("G", 152.0, 30.0, 0.5, 1800.0),
  };
  const std::vector<visibility::ObservabilityWindow> field_windows{
      make_window("E", t0, t0 + 7200.0),
      make_window("F", t0, t0 + 7200.0),
      make_window("G", t0, t0 + 7200.0),
  };
  const auto* square = fov::find_instrument("square10");
  const auto shared = planner::rank(field, field_windows, {.instrument = *square});
  const auto* e = entry_for(shared, "E");
  const auto* f = entry_for(shared, "F");
  const auto* g = entry_for(shared, "G");
  if (shared.status != core::Status::Ok || e == nullptr || f == nullptr || g == nullptr || f->co_observed_with != "E"
      || f->slot_start_utc_s != e->slot_start_utc_s || !f->pointing || f->rank != 2U || !g->co_observed_with.empty()
      || g->slot_start_utc_s != t0 + 1800.0 || !g->deferred) {
    spdlog::error("co-observation mismatch");
    return 6;
  }

  if (planner::rank(field, field_windows, {.default_slot_s = -1.0}).status != core::Status::InvalidInput
      || planner::rank(field, field_windows, {.instrument = fov::InstrumentProfile{.name = "empty"}}).status
             != core::Status::InvalidInput) {
    spdlog::error("invalid policy accepted");
    return 7;
  }

  const std::string csv = planner::plan_to_csv(shared);
  const auto lines = static_cast<std::size_t>(std::count(csv.begin(), csv.end(), '\n'));
  if (csv.rfind("rank,target_id,site_id,", 0) != 0U || lines != shared.entries.size() + 1U
      || planner::plan_to_csv(planner::rank(field, field_windows, {.instrument = *square})) != csv) {
    spdlog::error("plan csv mismatch");
    return 8;
  }

  const auto& hi_target = queue[4];
  const std::vector<visibility::ObservabilityWindow> two{make_window("hi", t0, t0 + 3600.0), make_window("hi", t0 + 86400.0, t0 + 90000.0)};
  if (std::abs(planner::score(planner::Scoring::TotalVisibleTime, hi_target, two) - 2.0) > 1e-12
      || planner::score(planner::Scoring::PriorityWeighted, hi_target, two) != 3.0
      || planner::score(planner::Scoring::EarliestWindow, hi_target, two) != -t0
      || planner::parse_scoring("visible_time") != planner::Scoring::TotalVisibleTime || planner::parse_scoring("bogus")
      || planner::to_string(planner::Scoring::MaxAltitude) != "max_altitude"
      || planner::parse_conflict_rule("overlap") != planner::ConflictRule::AllowOverlap) {
    spdlog::error("scoring rule mismatch");
    return 9;
  }
  return 0;
}
