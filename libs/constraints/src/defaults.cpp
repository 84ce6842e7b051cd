/**
 * @file defaults.cpp
 * @brief Constraint defaults profile loader.
 * @author Watosn
 */

#include "obsplan/constraints/defaults.hpp"

#include <fstream>
#include <istream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "obsplan/constraints/constraints.hpp"
#include "obsplan/core/text_utils.hpp"

namespace obsplan::constraints {
namespace {

bool parse_bool(const std::string& text, bool& value) {
  if (text == "1" || text == "true" || text == "yes" || text == "on") {
    value = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "no" || text == "off") {
    value = false;
    return true;
  }
  return false;
}

bool parse_optional(const std::string& text, std::optional<double>& value) {
  if (text == "off" || text == "none") {
    value.reset();
    return true;
  }
  double v = 0.0;
  if (!core::parse_double(text, v)) {
    return false;
  }
  value = v;
  return true;
}

bool parse_twilight_value(const std::string& text, std::optional<double>& value) {
  if (const auto t = parse_twilight(text)) {
    value = twilight_altitude_deg(*t);
    return true;
  }
  return parse_optional(text, value);
}

bool apply(const std::string& key, const std::string& value, ConstraintDefaults& d, bool& known) {
  known = true;
  if (key == "min_elevation_deg") {
    return core::parse_double(value, d.min_elevation_deg);
  }
  if (key == "max_elevation_deg") {
    return core::parse_double(value, d.max_elevation_deg);
  }
  if (key == "use_horizon") {
    return parse_bool(value, d.use_horizon);
  }
  if (key == "max_airmass") {
    return parse_optional(value, d.max_airmass);
  }
  if (key == "min_moon_separation_deg") {
    return parse_optional(value, d.min_moon_separation_deg);
  }
  if (key == "max_moon_illumination") {
    return parse_optional(value, d.max_moon_illumination);
  }
  if (key == "twilight") {
    return parse_twilight_value(value, d.max_sun_altitude_deg);
  }
  known = false;
  return true;
}

}  // namespace

DefaultsResult parse_constraint_defaults(std::istream& in, const ConstraintDefaults& base) {
  DefaultsResult out{.defaults = base};
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    line = core::trim(line);
    if (line.empty()) {
      continue;
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      spdlog::error("constraint profile line {}: expected 'key = value'", line_no);
      out.status = core::Status::InvalidInput;
      return out;
    }
    const std::string key = core::trim(line.substr(0, eq));
    const std::string value = core::trim(line.substr(eq + 1));
    bool known = true;
    if (!apply(key, value, out.defaults, known)) {
      spdlog::error("constraint profile line {}: bad value '{}' for '{}'", line_no, value, key);
      out.status = core::Status::InvalidInput;
      return out;
    }
    if (!known) {
      spdlog::warn("constraint profile line {}: unknown key '{}' skipped", line_no, key);
    }
  }
  return out;
}

DefaultsResult load_constraint_defaults(const std::filesystem::path& path, const ConstraintDefaults& base) {
  std::ifstream in(path);
  if (!in) {
    spdlog::error("failed to open constraint profile: {}", path.string());
    return DefaultsResult{.defaults = base, .status = core::Status::DataUnavailable};
  }
  return parse_constraint_defaults(in, base);
}

DefaultSetResult make_default_set(const ConstraintDefaults& defaults) {
  std::vector<ConstraintSet::Item> items;
  bool ok = true;
  auto push = [&items, &ok](ConstraintSet::Item item) {
    ok = ok && (item != nullptr);
    items.push_back(std::move(item));
  };

  push(ElevationConstraint::Create({.min_alt_deg = defaults.min_elevation_deg,
                                    .max_alt_deg = defaults.max_elevation_deg,
                                    .use_horizon = defaults.use_horizon}));
  if (defaults.max_airmass) {
    push(AirmassConstraint::Create({.max_airmass = *defaults.max_airmass}));
  }
  if (defaults.min_moon_separation_deg) {
    push(MoonSeparationConstraint::Create({.min_separation_deg = *defaults.min_moon_separation_deg}));
  }
  if (defaults.max_moon_illumination) {
    push(MoonIlluminationConstraint::Create({.max_fraction = *defaults.max_moon_illumination}));
  }
  if (defaults.max_sun_altitude_deg) {
    push(SunAltitudeConstraint::Create({.max_sun_alt_deg = *defaults.max_sun_altitude_deg}));
  }
  if (!ok) {
    return DefaultSetResult{.status = core::Status::InvalidInput};
  }
  return DefaultSetResult{.set = ConstraintSet(std::move(items))};
}

}  // namespace obsplan::constraints
