#include "ghost_bus/geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace ghost_bus {

double haversine_distance_m(const GeoCoordinate& from, const GeoCoordinate& to) noexcept {
    const auto to_radians = [](double degrees) {
        return degrees * std::numbers::pi / 180.0;
    };

    const double lat1 = to_radians(from.latitude_deg);
    const double lat2 = to_radians(to.latitude_deg);
    const double delta_lat = to_radians(to.latitude_deg - from.latitude_deg);
    const double delta_lon = to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    // Rounding can push a fraction above 1 for antipodal points.
    const double clamped = std::clamp(a, 0.0, 1.0);
    return 2.0 * k_earth_radius_m * std::asin(std::sqrt(clamped));
}

double haversine_distance_m(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg) noexcept {
    return haversine_distance_m(GeoCoordinate{lat1_deg, lon1_deg}, GeoCoordinate{lat2_deg, lon2_deg});
}

}  // namespace ghost_bus
