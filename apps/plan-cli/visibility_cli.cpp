/**
 * @file visibility_cli.cpp
 * @brief Observability windows for a target list at one or more sites.
 * @author Watosn
 */

#include <fstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cli_support.hpp"
#include "obsplan/constraints/defaults.hpp"
#include "obsplan/visibility/visibility_engine.hpp"
#include "obsplan/visibility/window_table.hpp"

int main(int argc, char** argv) {
  obsplan::cli::init_logging();
  if (argc < 5 || argc > 8) {
    spdlog::error("usage: visibility_cli <targets_csv> <site_ids> <start_iso> <hours> [step_s] [constraint_profile] [output_csv]");
    spdlog::error("targets row: id,ra,dec[,priority[,exposure_s[,pm_ra_mas_yr,pm_dec_mas_yr[,category]]]]");
    spdlog::error("site_ids: comma-separated, e.g. subaru,keck");
    return 1;
  }

  const std::string step = (argc >= 6) ? argv[5] : "300";
  const std::string profile = (argc >= 7) ? argv[6] : "";
  const std::string output_csv = (argc >= 8) ? argv[7] : "";

  const auto registry = obsplan::cli::make_registry();
  if (!registry) {
    spdlog::error("failed to build site registry");
    return 2;
  }
  const auto sites = obsplan::cli::resolve_sites(*registry, argv[2]);
  if (!sites) {
    return 2;
  }
  const auto span = obsplan::cli::parse_time_range(argv[3], argv[4], step);
  if (!span) {
    spdlog::error("bad time range: start='{}' hours='{}' step='{}'", argv[3], argv[4], step);
    return 3;
  }

  obsplan::catalog::Catalog catalog;
  if (!obsplan::cli::load_targets(argv[1], catalog)) {
    return 4;
  }

  obsplan::constraints::ConstraintDefaults defaults{};
  if (!profile.empty()) {
    const auto loaded = obsplan::constraints::load_constraint_defaults(profile);
    if (loaded.status != obsplan::core::Status::Ok) {
      return 5;
    }
    defaults = loaded.defaults;
  }
  const auto set = obsplan::constraints::make_default_set(defaults);
  if (set.status != obsplan::core::Status::Ok) {
    spdlog::error("constraint defaults out of range");
    return 5;
  }

  const auto engine = obsplan::visibility::VisibilityEngine::Create({});
  spdlog::info("computing windows for {} targets at {} sites, {} to {}", catalog.size(), sites->size(),
               obsplan::core::format_iso8601(span->start.utc_seconds), obsplan::core::format_iso8601(span->end.utc_seconds));
  const auto result = engine->compute_multi_site(catalog.targets(), *sites, set.set, *span);

  std::vector<obsplan::visibility::ObservabilityWindow> windows;
  int failures = 0;
  for (const auto& batch : result.sites) {
    if (batch.status != obsplan::core::Status::Ok) {
      spdlog::error("site '{}' failed: {}", batch.site_id, obsplan::core::to_string(batch.status));
      ++failures;
      continue;
    }
    for (const auto& e : batch.entries) {
      if (e.status != obsplan::core::Status::Ok) {
        spdlog::warn("target '{}' at '{}': {}", e.target_id, batch.site_id, obsplan::core::to_string(e.status));
        continue;
      }
      windows.insert(windows.end(), e.windows.begin(), e.windows.end());
    }
  }

  const std::string csv = obsplan::visibility::windows_to_csv(windows);
  if (output_csv.empty()) {
    fmt::print("{}", csv);
  } else {
    std::ofstream out(output_csv);
    if (!out) {
      spdlog::error("failed to open output csv: {}", output_csv);
      return 6;
    }
    out << csv;
    spdlog::info("wrote {} windows to {}", windows.size(), output_csv);
  }
  return (failures > 0) ? 7 : 0;
}
