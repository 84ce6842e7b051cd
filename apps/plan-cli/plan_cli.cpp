/**
 * @file plan_cli.cpp
 * @brief Rank a target list into an observing plan.
 * @author Watosn
 */

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cli_support.hpp"
#include "obsplan/constraints/defaults.hpp"
#include "obsplan/fov/footprint.hpp"
#include "obsplan/planner/planner.hpp"
#include "obsplan/visibility/visibility_engine.hpp"

int main(int argc, char** argv) {
  obsplan::cli::init_logging();
  if (argc < 5 || argc > 10) {
    spdlog::error("usage: plan_cli <targets_csv> <site_ids> <start_iso> <hours> [scoring] [conflict] [instrument|none] [pa_deg] [output_csv]");
    spdlog::error("scoring: priority | visible_time | max_altitude | earliest");
    spdlog::error("conflict: single | overlap");
    spdlog::error("instrument: square10 | moircs | focas | hsc | spcam");
    return 1;
  }

  const std::string scoring_name = (argc >= 6) ? argv[5] : "priority";
  const std::string conflict_name = (argc >= 7) ? argv[6] : "single";
  const std::string instrument_name = (argc >= 8) ? argv[7] : "none";
  const double pa_deg = (argc >= 9) ? std::atof(argv[8]) : 0.0;
  const std::string output_csv = (argc >= 10) ? argv[9] : "";

  const auto scoring = obsplan::planner::parse_scoring(scoring_name);
  const auto conflict = obsplan::planner::parse_conflict_rule(conflict_name);
  if (!scoring || !conflict) {
    spdlog::error("unknown scoring '{}' or conflict rule '{}'", scoring_name, conflict_name);
    return 1;
  }
  obsplan::planner::PlanPolicy policy{.scoring = *scoring, .conflict = *conflict, .pa_deg = pa_deg};
  if (instrument_name != "none") {
    const auto* profile = obsplan::fov::find_instrument(instrument_name);
    if (profile == nullptr) {
      spdlog::error("unknown instrument '{}'", instrument_name);
      return 1;
    }
    policy.instrument = *profile;
  }

  const auto registry = obsplan::cli::make_registry();
  const auto sites = obsplan::cli::resolve_sites(*registry, argv[2]);
  if (!sites) {
    return 2;
  }
  const auto span = obsplan::cli::parse_time_range(argv[3], argv[4], "300");
  if (!span) {
    spdlog::error("bad time range: start='{}' hours='{}'", argv[3], argv[4]);
    return 3;
  }
  obsplan::catalog::Catalog catalog;
  if (!obsplan::cli::load_targets(argv[1], catalog)) {
    return 4;
  }

  const auto set = obsplan::constraints::make_default_set({});
  const auto engine = obsplan::visibility::VisibilityEngine::Create({});
  const auto result = engine->compute_multi_site(catalog.targets(), *sites, set.set, *span);
  std::vector<obsplan::visibility::ObservabilityWindow> windows;
  for (const auto& batch : result.sites) {
    for (const auto& e : batch.entries) {
      if (e.status == obsplan::core::Status::Ok) {
        windows.insert(windows.end(), e.windows.begin(), e.windows.end());
      }
    }
  }

  const auto plan = obsplan::planner::rank(catalog.targets(), windows, policy);
  if (plan.status != obsplan::core::Status::Ok) {
    spdlog::error("planning failed: {}", obsplan::core::to_string(plan.status));
    return 5;
  }
  spdlog::info("{} entries planned, {} unscheduled", plan.entries.size(), plan.unscheduled.size());
  for (const auto& id : plan.unscheduled) {
    spdlog::info("unscheduled: {}", id);
  }

  const std::string csv = obsplan::planner::plan_to_csv(plan);
  if (output_csv.empty()) {
    fmt::print("{}", csv);
    return 0;
  }
  std::ofstream out(output_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", output_csv);
    return 6;
  }
  out << csv;
  return 0;
}
