/**
 * @file window_table.cpp
 * @brief Window CSV writer and reader.
 * @author Watosn
 */

#include "obsplan/visibility/window_table.hpp"

#include <istream>
#include <optional>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "obsplan/core/text_utils.hpp"
#include "obsplan/core/time_utils.hpp"
#include "obsplan/core/transforms.hpp"

namespace obsplan::visibility {
namespace {

constexpr std::size_t kMinWindowColumns = 5;

}  // namespace

std::string windows_to_csv(const std::vector<ObservabilityWindow>& windows) {
  std::string out = fmt::format("{}\n", kWindowCsvHeader);
  for (const auto& w : windows) {
    out += fmt::format("{},{},{},{},{:.4f},{},{:.4f}\n", w.target_id, w.site_id, core::format_iso8601(w.start_utc_s),
                       core::format_iso8601(w.end_utc_s), w.max_alt_deg, core::format_iso8601(w.max_alt_utc_s),
                       w.min_airmass);
  }
  return out;
}

WindowTableResult parse_windows_csv(std::istream& in) {
  WindowTableResult out{};
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    if (line_no == 1 && line.rfind("target_id", 0) == 0) {
      continue;
    }
    const auto f = core::split_csv_line(line);
    ObservabilityWindow w{};
    const auto start = (f.size() >= kMinWindowColumns) ? core::parse_iso8601(f[2]) : std::nullopt;
    const auto end = (f.size() >= kMinWindowColumns) ? core::parse_iso8601(f[3]) : std::nullopt;
    if (!start || !end || !(*end > *start) || f[0].empty() || !core::parse_double(f[4], w.max_alt_deg)) {
      spdlog::error("window table row {} malformed", line_no);
      out.status = core::Status::InvalidInput;
      out.windows.clear();
      return out;
    }
    w.target_id = f[0];
    w.site_id = f[1];
    w.start_utc_s = *start;
    w.end_utc_s = *end;
    w.max_alt_utc_s = *start;
    w.min_airmass = core::airmass(w.max_alt_deg);
    if (f.size() > kMinWindowColumns) {
      const auto t_max = core::parse_iso8601(f[5]);
      if (!t_max) {
        spdlog::error("window table row {}: bad max_alt_utc", line_no);
        out.status = core::Status::InvalidInput;
        out.windows.clear();
        return out;
      }
      w.max_alt_utc_s = *t_max;
    }
    if (f.size() > kMinWindowColumns + 1U && !core::parse_double(f[6], w.min_airmass)) {
      spdlog::error("window table row {}: bad min_airmass", line_no);
      out.status = core::Status::InvalidInput;
      out.windows.clear();
      return out;
    }
    out.windows.push_back(std::move(w));
  }
  return out;
}

}  // namespace obsplan::visibility
