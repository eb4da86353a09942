// === Position Report =========================================================
//
// Inbound telemetry record produced by a vehicle plus the trimmed sample that
// is retained in each vehicle's history window. `validate_report` is the gate
// every report passes before it may reach the state store.

#pragma once

#include <optional>
#include <string>

#include "ghost_bus/types.hpp"

namespace ghost_bus {

/**
 * @brief Raw position report as submitted by a producer.
 *
 * Immutable once received. The timestamp is producer supplied and may be
 * stale or skewed relative to the service clock.
 */
struct PositionReport final {
    std::string vehicle_id{};                 /**< Non-empty vehicle identifier. */
    double latitude_deg{};                    /**< Latitude in [-90, 90]. */
    double longitude_deg{};                   /**< Longitude in [-180, 180]. */
    std::string route_id{};                   /**< Non-empty route identifier. */
    std::optional<double> speed{};            /**< Instantaneous speed, producer units. */
    std::optional<double> bearing_deg{};      /**< Heading in degrees. */
    EpochSeconds timestamp_s{};               /**< Report time in epoch seconds. */
    std::optional<std::string> trip_id{};     /**< Scheduled trip, when known. */

    [[nodiscard]] GeoCoordinate coordinate() const noexcept {
        return GeoCoordinate{latitude_deg, longitude_deg};
    }
};

/** @brief Projection of a report kept for windowed analysis. */
struct HistorySample final {
    double latitude_deg{};
    double longitude_deg{};
    EpochSeconds timestamp_s{};
    std::optional<double> speed{};

    [[nodiscard]] GeoCoordinate coordinate() const noexcept {
        return GeoCoordinate{latitude_deg, longitude_deg};
    }
};

/** @brief Trim @p report down to the fields the history window keeps. */
[[nodiscard]] HistorySample make_history_sample(const PositionReport& report) noexcept;

/**
 * @brief Reject malformed reports.
 *
 * @throws ValidationError naming the first offending field: empty id or
 *         route, non-finite or out-of-range coordinates, non-finite
 *         timestamp/speed/bearing, or negative speed.
 */
void validate_report(const PositionReport& report);

}  // namespace ghost_bus
