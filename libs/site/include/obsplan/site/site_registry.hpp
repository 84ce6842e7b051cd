/**
 * @file site_registry.hpp
 * @brief Named-site registry for multi-observatory planning.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "obsplan/site/site.hpp"

namespace obsplan::site {

/**
 * @brief Registry of named observing sites keyed by id.
 */
class SiteRegistry final {
 public:
  /**
   * @brief Registry configuration.
   */
  struct Config {
    bool include_builtin{true};
    std::filesystem::path sites_csv{};
  };

  /**
   * @brief Factory helper: built-in observatories plus rows from `sites_csv` when given.
   *
   * CSV rows: `id,name,lat_deg,lon_deg,elevation_m,timezone_hours[,horizon]` where `horizon` is
   * `az:alt;az:alt;...`. Malformed rows are skipped with a warning.
   */
  static std::unique_ptr<SiteRegistry> Create(const Config& config);

  /**
   * @brief Add a site; fails with `InvalidSite` when malformed, `InvalidInput` when the id is taken.
   */
  [[nodiscard]] core::Status add(Site site);

  /**
   * @brief Lookup by id; nullptr when absent. The pointer is invalidated by a later `add`.
   */
  [[nodiscard]] const Site* find(const std::string& id) const;

  [[nodiscard]] std::vector<std::string> ids() const;
  [[nodiscard]] std::size_t size() const { return sites_.size(); }

 private:
  SiteRegistry() = default;

  std::vector<Site> sites_{};
};

/**
 * @brief Built-in observatory sites.
 */
[[nodiscard]] const std::vector<Site>& builtin_sites();

}  // namespace obsplan::site
