/**
 * @file text_utils.hpp
 * @brief Field splitting and number parsing for the CSV and profile loaders.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace obsplan::core {

/**
 * @brief Split one CSV line on commas. Empty fields are kept; a trailing comma adds none.
 */
inline std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(token);
  }
  return fields;
}

/**
 * @brief Parse the whole of `text` as a double. Empty text and trailing characters fail.
 */
inline bool parse_double(const std::string& text, double& value) {
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0';
}

inline std::string trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  return (first < last) ? std::string(first, last) : std::string{};
}

}  // namespace obsplan::core
