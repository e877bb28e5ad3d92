// === Geodesy =================================================================
//
// Great-circle helpers shared by the scheduler (travel speed), the catalog
// (exploration grid and position-derived identities), and the worker pool
// (start positions).

#pragma once

#include <numbers>

#include "spawnwatch/types.hpp"

namespace spawnwatch {

inline constexpr double k_earth_radius_m{6'371'000.0}; /**< Mean Earth radius used for geodesic calculations. */

/**
 * @brief Convert degrees to radians.
 */
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

/**
 * @brief Convert radians to degrees.
 */
constexpr double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

/**
 * @brief Determine the great-circle distance separating two coordinates.
 */
[[nodiscard]] double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

/**
 * @brief Compute a destination coordinate for a great-circle path.
 */
[[nodiscard]] GeodeticCoordinate offset_coordinate(const GeodeticCoordinate& origin, double bearing_deg, double distance_m);

/**
 * @brief Metres spanned by one degree of latitude / longitude around @p origin.
 */
[[nodiscard]] double metres_per_degree_latitude();
[[nodiscard]] double metres_per_degree_longitude(const GeodeticCoordinate& origin);

}  // namespace spawnwatch
