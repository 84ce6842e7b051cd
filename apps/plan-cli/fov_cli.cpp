/**
 * @file fov_cli.cpp
 * @brief Instrument footprint placement and target-in-field query.
 * @author Watosn
 */

#include <cstdlib>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cli_support.hpp"
#include "obsplan/fov/dither.hpp"
#include "obsplan/core/angles.hpp"
#include "obsplan/fov/footprint.hpp"

int main(int argc, char** argv) {
  obsplan::cli::init_logging();
  if (argc < 5 || argc > 9) {
    spdlog::error("usage: fov_cli <targets_csv> <instrument> <ra> <dec> [pa_deg] [dither] [n] [step_arcsec]");
    spdlog::error("dither: single | cross5 | circular");
    return 1;
  }

  const auto* profile = obsplan::fov::find_instrument(argv[2]);
  if (profile == nullptr) {
    spdlog::error("unknown instrument '{}'", argv[2]);
    return 1;
  }
  const auto ra = obsplan::core::angles::parse_ra_deg(argv[3]);
  const auto dec = obsplan::core::angles::parse_dec_deg(argv[4]);
  if (!ra || !dec) {
    spdlog::error("bad pointing '{}' '{}'", argv[3], argv[4]);
    return 2;
  }
  const double pa_deg = (argc >= 6) ? std::atof(argv[5]) : 0.0;
  const std::string dither_name = (argc >= 7) ? argv[6] : "single";
  const auto n = static_cast<std::size_t>((argc >= 8) ? std::atoi(argv[7]) : 1);
  const double step_arcsec = (argc >= 9) ? std::atof(argv[8]) : 60.0;
  const auto pattern = obsplan::fov::parse_dither_pattern(dither_name);
  if (!pattern) {
    spdlog::error("unknown dither pattern '{}'", dither_name);
    return 1;
  }

  obsplan::catalog::Catalog catalog;
  if (!obsplan::cli::load_targets(argv[1], catalog)) {
    return 3;
  }

  const obsplan::fov::Pointing center{.center = {.ra_deg = *ra, .dec_deg = *dec}, .pa_deg = pa_deg};
  std::vector<obsplan::fov::FOVFootprint> footprints;
  for (const auto& p : obsplan::fov::dither_pointings(center, *pattern, n, step_arcsec)) {
    const auto fp = obsplan::fov::footprint_at(*profile, p);
    if (fp.status != obsplan::core::Status::Ok) {
      spdlog::error("footprint failed: {}", obsplan::core::to_string(fp.status));
      return 4;
    }
    footprints.push_back(fp.footprint);
  }

  for (std::size_t i = 0; i < footprints.size(); ++i) {
    const auto& fp = footprints[i];
    fmt::print("pointing {} ra={} dec={} pa={:.2f}\n", i, obsplan::core::angles::format_ra(fp.pointing.center.ra_deg),
               obsplan::core::angles::format_dec(fp.pointing.center.dec_deg), fp.pointing.pa_deg);
    for (std::size_t k = 0; k < fp.sky.size(); ++k) {
      std::string verts;
      for (const auto& v : fp.sky[k]) {
        verts += fmt::format(" ({:.6f},{:.6f})", v.ra_deg, v.dec_deg);
      }
      fmt::print("  polygon {}:{}\n", k, verts);
    }
    for (const auto& id : obsplan::fov::targets_in_footprint(fp, catalog.targets())) {
      fmt::print("  contains {}\n", id);
    }
  }

  fmt::print("coverage\n");
  for (const auto& t : catalog.targets()) {
    const std::size_t count = obsplan::fov::coverage_count(footprints, t.position);
    if (count > 0) {
      fmt::print("  {} {}/{}\n", t.id, count, footprints.size());
    }
  }
  return 0;
}
