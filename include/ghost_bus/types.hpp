// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// service (wall-clock primitives, coordinates, bounding boxes).

#pragma once

#include <chrono>
#include <functional>

namespace ghost_bus {

/**
 * @brief Alias for the wall clock; producer timestamps are epoch based.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Seconds since the Unix epoch, double precision.
 */
using EpochSeconds = double;

/**
 * @brief Source of "now" for staleness checks. Injected so tests can pin time.
 */
using ClockFunction = std::function<EpochSeconds()>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/** @brief Current wall-clock time in epoch seconds. */
EpochSeconds wall_clock_now_s();

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeoCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Axis-aligned latitude/longitude box used as a coarse service area.
 */
struct GeoBoundingBox final {
    double min_latitude_deg{37.0};
    double max_latitude_deg{41.0};
    double min_longitude_deg{-109.0};
    double max_longitude_deg{-102.0};

    /** @brief True when @p coordinate lies inside the box (edges inclusive). */
    [[nodiscard]] bool contains(const GeoCoordinate& coordinate) const noexcept {
        return coordinate.latitude_deg >= min_latitude_deg && coordinate.latitude_deg <= max_latitude_deg
            && coordinate.longitude_deg >= min_longitude_deg && coordinate.longitude_deg <= max_longitude_deg;
    }
};

}  // namespace ghost_bus
