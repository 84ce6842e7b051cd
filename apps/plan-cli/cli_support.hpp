/**
 * @file cli_support.hpp
 * @brief Argument and input helpers shared by the planning CLIs.
 * @author Watosn
 */
#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "obsplan/catalog/target.hpp"
#include "obsplan/catalog/target_table.hpp"
#include "obsplan/core/text_utils.hpp"
#include "obsplan/core/time_utils.hpp"
#include "obsplan/site/site_registry.hpp"

namespace obsplan::cli {

/**
 * @brief Apply `OBSPLAN_LOG_LEVEL` (trace, debug, info, warn, error, critical, off).
 */
inline void init_logging() {
  if (const char* env = std::getenv("OBSPLAN_LOG_LEVEL")) {
    spdlog::set_level(spdlog::level::from_str(env));
  }
}

/**
 * @brief Load a target list into a catalog; malformed rows and duplicates are skipped with a warning.
 */
inline bool load_targets(const std::filesystem::path& path, catalog::Catalog& out) {
  std::ifstream in(path);
  if (!in) {
    spdlog::error("failed to open targets csv: {}", path.string());
    return false;
  }
  const auto stats = catalog::load_targets_csv(in, out);
  spdlog::info("loaded {} targets from {} ({} skipped)", stats.loaded, path.string(), stats.skipped);
  return true;
}

/**
 * @brief Resolve a comma-separated list of site ids against the registry.
 */
inline std::optional<std::vector<site::Site>> resolve_sites(const site::SiteRegistry& registry, const std::string& ids) {
  std::vector<site::Site> sites;
  for (const auto& id : core::split_csv_line(ids)) {
    const site::Site* s = registry.find(id);
    if (s == nullptr) {
      spdlog::error("unknown site '{}'", id);
      return std::nullopt;
    }
    sites.push_back(*s);
  }
  if (sites.empty()) {
    return std::nullopt;
  }
  return sites;
}

/**
 * @brief Time range from an ISO-8601 start, a duration in hours and a step in seconds.
 */
inline std::optional<core::TimeSpec> parse_time_range(const std::string& start_iso, const std::string& hours, const std::string& step_s) {
  const auto start = core::parse_iso8601(start_iso);
  double h = 0.0;
  double step = 0.0;
  if (!start || !core::parse_double(hours, h) || !core::parse_double(step_s, step) || !(h > 0.0) || !(step > 0.0)) {
    return std::nullopt;
  }
  return core::TimeSpec{.start = {*start}, .end = {*start + h * 3600.0}, .step_s = step};
}

/**
 * @brief Site registry from `OBSPLAN_SITES_FILE` (optional) plus the built-in observatories.
 */
inline std::unique_ptr<site::SiteRegistry> make_registry() {
  site::SiteRegistry::Config cfg{};
  if (const char* env = std::getenv("OBSPLAN_SITES_FILE")) {
    cfg.sites_csv = env;
  }
  return site::SiteRegistry::Create(cfg);
}

}  // namespace obsplan::cli
