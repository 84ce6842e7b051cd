/**
 * @file dither.hpp
 * @brief Dither pointing patterns and coverage queries over several footprints.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "obsplan/fov/footprint.hpp"

namespace obsplan::fov {

/**
 * @brief Dither layouts.
 *
 * `Cross5` is the five-point (0,0), (1,-2), (2,1), (-1,2), (-2,-1) step pattern;
 * `Circular` places `n` points on a circle of radius `step` starting north of the centre.
 */
enum class DitherPattern : std::uint8_t { Single, Cross5, Circular };

[[nodiscard]] std::string_view to_string(DitherPattern pattern);
[[nodiscard]] std::optional<DitherPattern> parse_dither_pattern(std::string_view text);

/**
 * @brief Pointings for a dither sequence; offsets are in the instrument frame and follow the position angle.
 *
 * `n` is used by `Circular` only (at least 1).
 */
[[nodiscard]] std::vector<Pointing> dither_pointings(const Pointing& center,
                                                     DitherPattern pattern,
                                                     std::size_t n,
                                                     double step_arcsec);

/**
 * @brief Number of footprints containing `p`.
 */
[[nodiscard]] std::size_t coverage_count(const std::vector<FOVFootprint>& footprints, const core::Equatorial& p);

[[nodiscard]] bool union_contains(const std::vector<FOVFootprint>& footprints, const core::Equatorial& p);

}  // namespace obsplan::fov
