/**
 * @file footprint.hpp
 * @brief Instrument field-of-view profiles and their placement on the sky.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "obsplan/catalog/target.hpp"
#include "obsplan/core/types.hpp"

namespace obsplan::fov {

/**
 * @brief Point in a tangent plane, arcsec; x toward east, y toward north.
 */
struct PlanePoint {
  double x_arcsec{};
  double y_arcsec{};
};

/// Closed outline; the last vertex connects back to the first.
using Polygon = std::vector<PlanePoint>;

/**
 * @brief Detector outlines in the instrument frame (position angle 0: +y is north).
 *
 * Polygons may be non-convex; a point is inside the profile when it is inside any polygon
 * under the even-odd rule.
 */
struct InstrumentProfile {
  std::string name{};
  std::vector<Polygon> polygons{};
};

/**
 * @brief `InvalidInput` for an unnamed profile, an empty polygon list, a polygon with fewer than 3 vertices or non-finite vertices.
 */
[[nodiscard]] core::Status validate_profile(const InstrumentProfile& profile);

[[nodiscard]] InstrumentProfile rectangle_profile(std::string name, double width_arcsec, double height_arcsec);
[[nodiscard]] InstrumentProfile circle_profile(std::string name, double radius_arcsec, std::size_t segments = 72);

/**
 * @brief `cols` x `rows` detectors of `ccd_w` x `ccd_h`, separated by `gap`, centred on the boresight.
 */
[[nodiscard]] InstrumentProfile mosaic_profile(std::string name,
                                               std::size_t cols,
                                               std::size_t rows,
                                               double ccd_w_arcsec,
                                               double ccd_h_arcsec,
                                               double gap_arcsec);

/**
 * @brief Profiles shipped with the library.
 */
[[nodiscard]] const std::vector<InstrumentProfile>& builtin_instruments();
[[nodiscard]] const InstrumentProfile* find_instrument(const std::string& name);

/**
 * @brief Boresight position (mean J2000) and position angle of the instrument +y axis, east of north.
 */
struct Pointing {
  core::Equatorial center{};
  double pa_deg{};
};

/**
 * @brief A profile placed at a pointing.
 *
 * `plane` holds the rotated polygons in tangent-plane coordinates around the pointing centre;
 * `sky` holds the same vertices deprojected to RA/Dec for overlay rendering.
 */
struct FOVFootprint {
  std::string instrument{};
  Pointing pointing{};
  std::vector<Polygon> plane{};
  std::vector<std::vector<core::Equatorial>> sky{};
};

struct FootprintResult {
  FOVFootprint footprint{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Rotate the profile by the position angle and place it at the pointing centre.
 */
[[nodiscard]] FootprintResult footprint_at(const InstrumentProfile& profile, const Pointing& pointing);

/**
 * @brief Gnomonic projection about `center`; nullopt for points 90 deg or more away.
 */
[[nodiscard]] std::optional<PlanePoint> project(const core::Equatorial& center, const core::Equatorial& p);

/**
 * @brief Inverse gnomonic projection.
 */
[[nodiscard]] core::Equatorial deproject(const core::Equatorial& center, const PlanePoint& p);

/**
 * @brief Even-odd point-in-polygon test.
 */
[[nodiscard]] bool point_in_polygon(const Polygon& polygon, const PlanePoint& p);

[[nodiscard]] bool contains(const FOVFootprint& footprint, const core::Equatorial& p);

/**
 * @brief Ids of the targets inside the footprint, sorted.
 */
[[nodiscard]] std::vector<std::string> targets_in_footprint(const FOVFootprint& footprint,
                                                            const std::vector<catalog::Target>& targets);

}  // namespace obsplan::fov
