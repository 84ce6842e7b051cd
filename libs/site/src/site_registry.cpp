/**
 * @file site_registry.cpp
 * @brief Named-site registry implementation.
 * @author Watosn
 */

#include "obsplan/site/site_registry.hpp"

#include <algorithm>
#include <fstream>

#include <spdlog/spdlog.h>

#include "obsplan/core/text_utils.hpp"

namespace obsplan::site {
namespace {

constexpr std::size_t kMinSiteColumns = 6;

Site make_site(std::string id, std::string name, double lat, double lon, double elev_m, double tz_hours) {
  Site s{};
  s.id = std::move(id);
  s.name = std::move(name);
  s.location = core::GeodeticPoint{.lat_deg = lat, .lon_deg = lon, .alt_m = elev_m};
  s.timezone_hours = tz_hours;
  return s;
}

std::optional<Site> parse_site_row(const std::vector<std::string>& fields) {
  if (fields.size() < kMinSiteColumns) {
    return std::nullopt;
  }
  double lat = 0.0;
  double lon = 0.0;
  double elev = 0.0;
  double tz = 0.0;
  if (!core::parse_double(fields[2], lat) || !core::parse_double(fields[3], lon) || !core::parse_double(fields[4], elev)
      || !core::parse_double(fields[5], tz)) {
    return std::nullopt;
  }
  Site s = make_site(fields[0], fields[1], lat, lon, elev, tz);
  if (fields.size() > kMinSiteColumns && !fields[6].empty()) {
    auto horizon = HorizonProfile::Parse(fields[6]);
    if (!horizon) {
      return std::nullopt;
    }
    s.horizon = std::move(*horizon);
  }
  return s;
}

}  // namespace

const std::vector<Site>& builtin_sites() {
  static const std::vector<Site> sites = {
      make_site("subaru", "Subaru Telescope, Maunakea", 19.8255, -155.4760, 4163.0, -10.0),
      make_site("keck", "W. M. Keck Observatory, Maunakea", 19.8263, -155.4747, 4145.0, -10.0),
      make_site("palomar", "Palomar Observatory", 33.3563, -116.8650, 1712.0, -8.0),
      make_site("kpno", "Kitt Peak National Observatory", 31.9583, -111.5967, 2096.0, -7.0),
      make_site("paranal", "Cerro Paranal", -24.6272, -70.4042, 2635.0, -4.0),
      make_site("lasilla", "La Silla Observatory", -29.2567, -70.7300, 2347.0, -4.0),
      make_site("roque", "Roque de los Muchachos", 28.7606, -17.8816, 2326.0, 0.0),
      make_site("sso", "Siding Spring Observatory", -31.2733, 149.0644, 1165.0, 10.0),
      make_site("okayama", "Okayama Astrophysical Observatory", 34.5766, 133.5936, 372.0, 9.0),
  };
  return sites;
}

std::unique_ptr<SiteRegistry> SiteRegistry::Create(const Config& config) {
  auto out = std::unique_ptr<SiteRegistry>(new SiteRegistry());
  if (config.include_builtin) {
    for (const auto& s : builtin_sites()) {
      const core::Status st = out->add(s);
      if (st != core::Status::Ok) {
        spdlog::warn("built-in site '{}' rejected: {}", s.id, core::to_string(st));
      }
    }
  }
  if (config.sites_csv.empty()) {
    return out;
  }

  std::ifstream in(config.sites_csv);
  if (!in) {
    spdlog::error("failed to open site table: {}", config.sites_csv.string());
    return out;
  }
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const auto fields = core::split_csv_line(line);
    auto site = parse_site_row(fields);
    if (!site) {
      if (line_no == 1 && line.find("lat") != std::string::npos) {
        continue;
      }
      spdlog::warn("skipping malformed site row {}", line_no);
      continue;
    }
    const core::Status st = out->add(std::move(*site));
    if (st != core::Status::Ok) {
      spdlog::warn("site row {} rejected: {}", line_no, core::to_string(st));
    }
  }
  spdlog::debug("site registry holds {} sites", out->size());
  return out;
}

core::Status SiteRegistry::add(Site site) {
  const core::Status st = validate_site(site);
  if (st != core::Status::Ok) {
    return st;
  }
  if (find(site.id) != nullptr) {
    return core::Status::InvalidInput;
  }
  sites_.push_back(std::move(site));
  return core::Status::Ok;
}

const Site* SiteRegistry::find(const std::string& id) const {
  const auto it = std::find_if(sites_.begin(), sites_.end(), [&id](const Site& s) { return s.id == id; });
  return (it == sites_.end()) ? nullptr : &*it;
}

std::vector<std::string> SiteRegistry::ids() const {
  std::vector<std::string> out;
  out.reserve(sites_.size());
  for (const auto& s : sites_) {
    out.push_back(s.id);
  }
  return out;
}

}  // namespace obsplan::site
