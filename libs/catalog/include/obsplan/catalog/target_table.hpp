/**
 * @file target_table.hpp
 * @brief Tabular (CSV) form of target lists.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

#include "obsplan/catalog/target.hpp"

namespace obsplan::catalog {

/**
 * @brief Parse a target row `id,ra,dec[,priority[,exposure_s[,pm_ra_mas_yr,pm_dec_mas_yr[,category]]]]`.
 *
 * RA/Dec accept sexagesimal or decimal degrees; empty optional fields keep their defaults.
 * Proper motion is given as a pair: a row carrying only `pm_ra_mas_yr` is malformed.
 */
[[nodiscard]] std::optional<Target> parse_target_row(const std::string& line);

struct TargetTableStats {
  std::size_t loaded{};
  std::size_t skipped{};
};

/**
 * @brief Add every row of a target table to `out`.
 *
 * Blank lines, `#` comments and a leading `id,` header are ignored. Malformed rows and
 * duplicate ids are skipped with a warning and counted.
 */
TargetTableStats load_targets_csv(std::istream& in, Catalog& out);

}  // namespace obsplan::catalog
