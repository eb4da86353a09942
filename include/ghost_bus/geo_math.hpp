// === Geo Math ================================================================
//
// Great-circle helpers shared by the anomaly rules and the history window.

#pragma once

#include "ghost_bus/types.hpp"

namespace ghost_bus {

/** @brief Mean Earth radius used by the haversine formula. */
inline constexpr double k_earth_radius_m{6'371'000.0};

/**
 * @brief Haversine distance in metres between two coordinates.
 *
 * Total and symmetric; identical inputs yield exactly zero.
 */
[[nodiscard]] double haversine_distance_m(const GeoCoordinate& from, const GeoCoordinate& to) noexcept;

/** @copydoc haversine_distance_m */
[[nodiscard]] double haversine_distance_m(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg) noexcept;

}  // namespace ghost_bus
