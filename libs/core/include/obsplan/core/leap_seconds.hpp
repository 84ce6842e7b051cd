/**
 * @file leap_seconds.hpp
 * @brief Leap-second table and UTC->TAI offsets.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace obsplan::core::leap_seconds {

struct Entry {
  double utc_epoch_s{};
  double tai_minus_utc_s{};
};

using Table = std::vector<Entry>;

// Offsets before 1972 are held at the 1972 value; the engine only needs
// second-level accuracy for sidereal time over that era.
inline const Table& builtin_table() {
  static const Table table = {
      {63072000.0, 10.0},    {78796800.0, 11.0},    {94694400.0, 12.0},    {126230400.0, 13.0},
      {157766400.0, 14.0},   {189302400.0, 15.0},   {220924800.0, 16.0},   {252460800.0, 17.0},
      {283996800.0, 18.0},   {315532800.0, 19.0},   {362793600.0, 20.0},   {394329600.0, 21.0},
      {425865600.0, 22.0},   {489024000.0, 23.0},   {567993600.0, 24.0},   {631152000.0, 25.0},
      {662688000.0, 26.0},   {709948800.0, 27.0},   {741484800.0, 28.0},   {773020800.0, 29.0},
      {820454400.0, 30.0},   {867715200.0, 31.0},   {915148800.0, 32.0},   {1136073600.0, 33.0},
      {1230768000.0, 34.0},  {1341100800.0, 35.0},  {1435708800.0, 36.0},  {1483228800.0, 37.0},
  };
  return table;
}

/**
 * @brief Parse a leap-second table: one `utc_epoch_s tai_minus_utc_s` pair per line,
 * whitespace or comma separated, `#` comments allowed.
 */
inline std::optional<Table> parse_table(std::istream& in) {
  Table parsed{};
  std::string line{};
  while (std::getline(in, line)) {
    const auto first = std::find_if_not(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    if (first == line.end() || *first == '#') {
      continue;
    }
    std::replace(line.begin(), line.end(), ',', ' ');
    std::istringstream iss(line);
    Entry e{};
    if (!(iss >> e.utc_epoch_s >> e.tai_minus_utc_s)) {
      return std::nullopt;
    }
    parsed.push_back(e);
  }
  if (parsed.empty()) {
    return std::nullopt;
  }
  std::sort(parsed.begin(), parsed.end(), [](const Entry& a, const Entry& b) { return a.utc_epoch_s < b.utc_epoch_s; });
  return parsed;
}

inline std::optional<Table> load_table_from_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return std::nullopt;
  }
  return parse_table(in);
}

/**
 * @brief Table in effect for the process: `OBSPLAN_LEAP_SECONDS_FILE` if set and valid, else built-in.
 */
inline const Table& active_table() {
  static const Table table = []() {
    const char* env = std::getenv("OBSPLAN_LEAP_SECONDS_FILE");
    if (env != nullptr && env[0] != '\0') {
      if (auto loaded = load_table_from_file(std::string(env))) {
        return *loaded;
      }
      spdlog::warn("leap-second file '{}' unreadable, using built-in table", env);
    }
    return builtin_table();
  }();
  return table;
}

inline double tai_minus_utc_seconds(const double utc_seconds, const Table& table) {
  const auto it = std::upper_bound(table.begin(), table.end(), utc_seconds,
                                   [](double t, const Entry& e) { return t < e.utc_epoch_s; });
  if (it == table.begin()) {
    return table.front().tai_minus_utc_s;
  }
  return std::prev(it)->tai_minus_utc_s;
}

inline double tai_minus_utc_seconds(const double utc_seconds) {
  return tai_minus_utc_seconds(utc_seconds, active_table());
}

}  // namespace obsplan::core::leap_seconds
