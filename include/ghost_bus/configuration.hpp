// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the server: logging,
// detector thresholds, delivery limits, retention, and the demo feed.
// `ConfigurationLoader` translates environment variables into these structures
// so downstream modules never touch `std::getenv` directly.

#pragma once

#include <string>

#include "ghost_bus/ghost_bus_service.hpp"
#include "ghost_bus/types.hpp"

namespace ghost_bus {

/**
 * @brief Immutable bundle of runtime knobs for the ghost bus server.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables
 * directly.
 */
struct Configuration final {
    std::string log_directory{};     /**< Destination directory for structured logs. */
    std::string log_level{"info"};   /**< spdlog level name. */
    ServiceConfig service{};         /**< Classification core and delivery settings. */
    std::string gtfs_directory{};    /**< GTFS feed directory; empty skips loading. */
    double simulator_hz{};           /**< Demo feed cadence in Hertz; zero disables it. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Initialize logging and read every GHOST_BUS_* variable. */
    static Configuration load();

    /** @brief Parse "min_lat,max_lat,min_lon,max_lon", returning @p fallback on error. */
    static GeoBoundingBox parse_geofence(const char* raw_value, const GeoBoundingBox& fallback);
};

}  // namespace ghost_bus
