// === Vehicle Status ==========================================================
//
// The classified view of a vehicle that the store publishes: its latest report
// plus the tags, severity and lifecycle derived from it, stamped with the
// global commit sequence. Also the query-side filter and per-vehicle summary.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "ghost_bus/anomaly.hpp"
#include "ghost_bus/position_report.hpp"

namespace ghost_bus {

/**
 * @brief Latest report for a vehicle enriched with its classification.
 *
 * Every derived field reflects the same input report; the store replaces the
 * whole value on each write and never mutates one in place.
 */
struct VehicleStatus final {
    PositionReport report{};                            /**< Report the classification was derived from. */
    bool is_ghost{};                                    /**< True when any anomaly tag fired. */
    AnomalyTagSet anomaly_tags{};                       /**< Tags emitted by the rule set. */
    Severity severity{Severity::Info};                  /**< Summary of the tag set. */
    LifecycleStatus lifecycle{LifecycleStatus::Active}; /**< "ghost" when is_ghost, else "active". */
    EpochSeconds evaluated_at_s{};                      /**< Service clock when the rules ran. */
    std::uint64_t sequence{};                           /**< Global commit order, starting at 1. */

    [[nodiscard]] const std::string& vehicle_id() const noexcept {
        return report.vehicle_id;
    }
};

/** @brief Windowed aggregates for one vehicle. */
struct VehicleStatistics final {
    std::size_t position_history_count{};
    std::size_t speed_history_count{};
    std::optional<double> mean_speed{};
    double total_distance_m{};
};

/** @brief Query-side filter over vehicle statuses. */
struct StatusFilter final {
    bool show_active{true};
    bool show_ghost{true};
    std::optional<std::set<std::string>> routes{};  /**< Restrict to these route ids when set. */

    [[nodiscard]] bool accepts(const VehicleStatus& status) const {
        if (status.is_ghost ? !show_ghost : !show_active) {
            return false;
        }
        if (routes.has_value() && routes->count(status.report.route_id) == 0) {
            return false;
        }
        return true;
    }
};

}  // namespace ghost_bus
