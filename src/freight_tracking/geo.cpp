#include "freight_tracking/geo.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numbers>

namespace freight_tracking {

namespace {

constexpr double k_microdegree_scale{1'000'000.0};

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

}  // namespace

double haversine_distance_km(const GeodeticCoordinate& from, const GeodeticCoordinate& to) {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_km * c;
}

double path_length_km(const std::vector<GeodeticCoordinate>& path) {
    double total_km = 0.0;
    for (std::size_t index = 1; index < path.size(); ++index) {
        total_km += haversine_distance_km(path[index - 1], path[index]);
    }
    return total_km;
}

double planar_segment_distance_deg(const GeodeticCoordinate& point,
                                   const GeodeticCoordinate& start,
                                   const GeodeticCoordinate& end) {
    const double dx = end.longitude_deg - start.longitude_deg;
    const double dy = end.latitude_deg - start.latitude_deg;
    const double length_squared = dx * dx + dy * dy;

    if (length_squared == 0.0) {
        return std::hypot(point.longitude_deg - start.longitude_deg, point.latitude_deg - start.latitude_deg);
    }

    const double projection = ((point.longitude_deg - start.longitude_deg) * dx
                               + (point.latitude_deg - start.latitude_deg) * dy) / length_squared;
    const double t = std::clamp(projection, 0.0, 1.0);
    const double nearest_lon = start.longitude_deg + t * dx;
    const double nearest_lat = start.latitude_deg + t * dy;
    return std::hypot(point.longitude_deg - nearest_lon, point.latitude_deg - nearest_lat);
}

double round_to_microdegrees(double degrees) {
    return std::round(degrees * k_microdegree_scale) / k_microdegree_scale;
}

bool is_valid_latitude(double latitude_deg) noexcept {
    return std::isfinite(latitude_deg) && latitude_deg >= -90.0 && latitude_deg <= 90.0;
}

bool is_valid_longitude(double longitude_deg) noexcept {
    return std::isfinite(longitude_deg) && longitude_deg >= -180.0 && longitude_deg <= 180.0;
}

}  // namespace freight_tracking
