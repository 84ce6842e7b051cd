/**
 * @file sky_track_cli.cpp
 * @brief Altitude/azimuth/airmass track of one target for plotting.
 * @author Watosn
 */

#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cli_support.hpp"
#include "obsplan/core/angles.hpp"
#include "obsplan/site/site.hpp"
#include "obsplan/visibility/sky_track.hpp"

int main(int argc, char** argv) {
  obsplan::cli::init_logging();
  if (argc < 6 || argc > 8) {
    spdlog::error("usage: sky_track_cli <site_id> <ra> <dec> <start_iso> <hours> [step_s] [local:0|1]");
    return 1;
  }

  const auto registry = obsplan::cli::make_registry();
  const obsplan::site::Site* site = registry->find(argv[1]);
  if (site == nullptr) {
    spdlog::error("unknown site '{}'", argv[1]);
    return 2;
  }
  const auto ra = obsplan::core::angles::parse_ra_deg(argv[2]);
  const auto dec = obsplan::core::angles::parse_dec_deg(argv[3]);
  if (!ra || !dec) {
    spdlog::error("bad coordinates '{}' '{}'", argv[2], argv[3]);
    return 3;
  }
  const std::string step = (argc >= 7) ? argv[6] : "600";
  const bool local = (argc >= 8) && std::string(argv[7]) == "1";
  const auto span = obsplan::cli::parse_time_range(argv[4], argv[5], step);
  if (!span) {
    spdlog::error("bad time range: start='{}' hours='{}' step='{}'", argv[4], argv[5], step);
    return 4;
  }

  obsplan::catalog::Target target{};
  target.id = "target";
  target.position = obsplan::core::Equatorial{.ra_deg = *ra, .dec_deg = *dec};
  const auto track = obsplan::visibility::sky_track(target, *site, *span);
  if (track.status != obsplan::core::Status::Ok) {
    spdlog::error("sky track failed: {}", obsplan::core::to_string(track.status));
    return 5;
  }

  fmt::print("time,alt_deg,az_deg,airmass,hour_angle_deg,parallactic_deg,moon_sep_deg,sun_alt_deg\n");
  for (const auto& p : track.points) {
    const std::string stamp = local ? obsplan::site::local_time_iso(*site, {p.utc_seconds})
                                    : obsplan::core::format_iso8601(p.utc_seconds);
    fmt::print("{},{:.4f},{:.4f},{:.4f},{:.4f},{:.4f},{:.4f},{:.4f}\n", stamp, p.altaz.alt_deg, p.altaz.az_deg, p.airmass,
               p.hour_angle_deg, p.parallactic_angle_deg, p.moon_separation_deg, p.sun_alt_deg);
  }
  return 0;
}
