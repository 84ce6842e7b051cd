/**
 * @file window_table.hpp
 * @brief Tabular (CSV) form of observability windows.
 * @author Watosn
 */
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "obsplan/visibility/window.hpp"

namespace obsplan::visibility {

inline constexpr const char* kWindowCsvHeader = "target_id,site_id,start_utc,end_utc,max_alt_deg,max_alt_utc,min_airmass";

/**
 * @brief One row per window, ISO-8601 UTC times, header line first.
 */
[[nodiscard]] std::string windows_to_csv(const std::vector<ObservabilityWindow>& windows);

struct WindowTableResult {
  std::vector<ObservabilityWindow> windows{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Parse rows written by `windows_to_csv`; the last two columns are optional.
 *
 * A header line is skipped; any malformed row fails the whole table with `InvalidInput`.
 */
[[nodiscard]] WindowTableResult parse_windows_csv(std::istream& in);

}  // namespace obsplan::visibility
