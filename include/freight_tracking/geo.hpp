// === Geodesy Helpers =========================================================
//
// Great-circle and planar distance primitives shared by the trajectory and
// ETA engines.

#pragma once

#include <vector>

#include "freight_tracking/types.hpp"

namespace freight_tracking {

inline constexpr double k_earth_radius_km{6'371.0};

/** @brief Haversine distance between two coordinates in kilometres. */
[[nodiscard]] double haversine_distance_km(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

/**
 * @brief Distance in degrees from @p point to the segment [@p start, @p end],
 *        treating longitude/latitude as planar axes.
 *
 * This is the metric Douglas-Peucker simplification bounds, so tolerances
 * are expressed in the same degree units. A degenerate segment collapses to
 * the point distance.
 */
[[nodiscard]] double planar_segment_distance_deg(const GeodeticCoordinate& point,
                                                 const GeodeticCoordinate& start,
                                                 const GeodeticCoordinate& end);

/** @brief Sum of haversine legs along @p path; zero for fewer than two points. */
[[nodiscard]] double path_length_km(const std::vector<GeodeticCoordinate>& path);

/** @brief Round a coordinate component to six decimal places. */
[[nodiscard]] double round_to_microdegrees(double degrees);

[[nodiscard]] bool is_valid_latitude(double latitude_deg) noexcept;
[[nodiscard]] bool is_valid_longitude(double longitude_deg) noexcept;

}  // namespace freight_tracking
