#include "spawnwatch/geodesy.hpp"

#include <algorithm>
#include <cmath>

namespace spawnwatch {

namespace {
constexpr double k_minimum_longitude_scale{1e-6}; /**< Keeps the longitude scale finite at the poles. */
}

double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_m * c;
}

GeodeticCoordinate offset_coordinate(const GeodeticCoordinate& origin, double bearing_deg, double distance_m) {
    const double angular_distance = distance_m / k_earth_radius_m;
    const double bearing_rad = degrees_to_radians(bearing_deg);
    const double lat_rad = degrees_to_radians(origin.latitude_deg);
    const double lon_rad = degrees_to_radians(origin.longitude_deg);

    const double new_lat = std::asin(
        std::sin(lat_rad) * std::cos(angular_distance) + std::cos(lat_rad) * std::sin(angular_distance) * std::cos(bearing_rad)
    );

    const double new_lon = lon_rad
        + std::atan2(
            std::sin(bearing_rad) * std::sin(angular_distance) * std::cos(lat_rad),
            std::cos(angular_distance) - std::sin(lat_rad) * std::sin(new_lat)
        );

    return GeodeticCoordinate{radians_to_degrees(new_lat), radians_to_degrees(new_lon)};
}

double metres_per_degree_latitude() {
    return k_earth_radius_m * std::numbers::pi / 180.0;
}

double metres_per_degree_longitude(const GeodeticCoordinate& origin) {
    const double scale = std::max(std::cos(degrees_to_radians(origin.latitude_deg)), k_minimum_longitude_scale);
    return metres_per_degree_latitude() * scale;
}

}  // namespace spawnwatch
