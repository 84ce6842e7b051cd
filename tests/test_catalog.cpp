/**
 * @file test_catalog.cpp
 * @brief Target table parsing, catalog uniqueness and proper motion tests.
 * @author Watosn
 */

#include <cmath>
#include <sstream>

#include <spdlog/spdlog.h>

#include "obsplan/catalog/target_table.hpp"
#include "obsplan/core/time_utils.hpp"

namespace {

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace obsplan;

  const auto full = catalog::parse_target_row("m42,05:35:17.3,-05:23:28,2.5,1200,1.5,-0.5,nebula");
  if (!full || full->id != "m42" || !approx_abs(full->position.ra_deg, 83.82208, 1e-4)
      || !approx_abs(full->position.dec_deg, -5.39111, 1e-4) || full->priority != 2.5 || !full->exposure_s
      || *full->exposure_s != 1200.0 || full->pm_ra_mas_yr != 1.5 || full->pm_dec_mas_yr != -0.5 || full->category != "nebula") {
    spdlog::error("full target row mismatch");
    return 1;
  }

  const auto minimal = catalog::parse_target_row("vega,279.2347,38.7837");
  const auto blanks = catalog::parse_target_row("deneb,310.358,45.280,,,,,bright");
  if (!minimal || minimal->priority != 1.0 || minimal->exposure_s || !blanks || blanks->pm_ra_mas_yr != 0.0
      || blanks->exposure_s || blanks->category != "bright") {
    spdlog::error("optional target fields mismatch");
    return 2;
  }

  // Proper motion comes as a pair; half of it is a malformed row.
  if (catalog::parse_target_row("half,10.0,20.0,1,600,3.5") || catalog::parse_target_row("half,10.0,20.0,1,600,3.5,")
      || catalog::parse_target_row("half,10.0,20.0,1,600,,3.5")) {
    spdlog::error("row with one proper motion component accepted");
    return 3;
  }

  if (catalog::parse_target_row(",10.0,20.0") || catalog::parse_target_row("bad,25:00:00,20.0")
      || catalog::parse_target_row("bad,10.0,95.0") || catalog::parse_target_row("bad,10.0,20.0,high")
      || catalog::parse_target_row("bad,10.0")) {
    spdlog::error("malformed target row accepted");
    return 4;
  }

  std::istringstream table(
      "id,ra,dec,priority,exposure_s,pm_ra_mas_yr,pm_dec_mas_yr,category\n"
      "# comment\n"
      "\n"
      "m42,05:35:17.3,-05:23:28,2.5,1200\r\n"
      "half,10.0,20.0,1,600,3.5\n"
      "m42,83.8,-5.4\n"
      "neg,10.0,20.0,-1\n"
      "vega,279.2347,38.7837,1,,200.94,286.23\n");
  catalog::Catalog cat;
  const auto stats = catalog::load_targets_csv(table, cat);
  if (stats.loaded != 2U || stats.skipped != 3U || cat.size() != 2U || cat.find("m42") == nullptr || cat.find("vega") == nullptr
      || cat.find("half") != nullptr || cat.find("neg") != nullptr) {
    spdlog::error("target table load mismatch: {} loaded, {} skipped", stats.loaded, stats.skipped);
    return 5;
  }

  // Vega: 10 years of proper motion moves it about 2.86" north.
  const auto* vega = cat.find("vega");
  const auto t2010 = core::parse_iso8601("2010-01-01T12:00:00Z");
  if (!t2010) {
    spdlog::error("epoch parse failure");
    return 6;
  }
  const auto moved = catalog::position_at(*vega, *t2010);
  const double dec_shift_as = (moved.dec_deg - vega->position.dec_deg) * 3600.0;
  if (!approx_abs(dec_shift_as, 2.8623, 0.01) || !(moved.ra_deg > vega->position.ra_deg)
      || catalog::position_at(*cat.find("m42"), *t2010).ra_deg != cat.find("m42")->position.ra_deg) {
    spdlog::error("proper motion propagation mismatch: {} arcsec", dec_shift_as);
    return 7;
  }
  return 0;
}
