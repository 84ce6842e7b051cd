/**
 * @file target_table.cpp
 * @brief Target list CSV parsing.
 * @author Watosn
 */

#include "obsplan/catalog/target_table.hpp"

#include <istream>
#include <utility>

#include <spdlog/spdlog.h>

#include "obsplan/core/angles.hpp"
#include "obsplan/core/text_utils.hpp"

namespace obsplan::catalog {
namespace {

constexpr std::size_t kPmRaColumn = 5;
constexpr std::size_t kPmDecColumn = 6;
constexpr std::size_t kCategoryColumn = 7;

}  // namespace

std::optional<Target> parse_target_row(const std::string& line) {
  const auto f = core::split_csv_line(line);
  if (f.size() < 3U || f[0].empty()) {
    return std::nullopt;
  }
  const auto ra = core::angles::parse_ra_deg(f[1]);
  const auto dec = core::angles::parse_dec_deg(f[2]);
  if (!ra || !dec) {
    return std::nullopt;
  }
  Target t{};
  t.id = f[0];
  t.name = f[0];
  t.position = core::Equatorial{.ra_deg = *ra, .dec_deg = *dec};
  if (f.size() > 3U && !f[3].empty() && !core::parse_double(f[3], t.priority)) {
    return std::nullopt;
  }
  if (f.size() > 4U && !f[4].empty()) {
    double exp_s = 0.0;
    if (!core::parse_double(f[4], exp_s)) {
      return std::nullopt;
    }
    t.exposure_s = exp_s;
  }
  if (f.size() == kPmDecColumn) {
    spdlog::warn("target '{}': pm_ra_mas_yr given without pm_dec_mas_yr", t.id);
    return std::nullopt;
  }
  if (f.size() > kPmDecColumn) {
    const bool ra_empty = f[kPmRaColumn].empty();
    const bool dec_empty = f[kPmDecColumn].empty();
    if (ra_empty != dec_empty) {
      spdlog::warn("target '{}': proper motion needs both components", t.id);
      return std::nullopt;
    }
    if (!ra_empty && (!core::parse_double(f[kPmRaColumn], t.pm_ra_mas_yr) || !core::parse_double(f[kPmDecColumn], t.pm_dec_mas_yr))) {
      return std::nullopt;
    }
  }
  if (f.size() > kCategoryColumn) {
    t.category = f[kCategoryColumn];
  }
  return t;
}

TargetTableStats load_targets_csv(std::istream& in, Catalog& out) {
  TargetTableStats stats{};
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line.front() == '#') {
      continue;
    }
    auto target = parse_target_row(line);
    if (!target) {
      if (line_no == 1 && line.rfind("id,", 0) == 0) {
        continue;
      }
      spdlog::warn("skipping malformed target row {}", line_no);
      ++stats.skipped;
      continue;
    }
    const auto st = out.add(std::move(*target));
    if (st != core::Status::Ok) {
      spdlog::warn("skipping target row {}: {}", line_no, core::to_string(st));
      ++stats.skipped;
      continue;
    }
    ++stats.loaded;
  }
  return stats;
}

}  // namespace obsplan::catalog
