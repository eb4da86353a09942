// === Anomaly Vocabulary ======================================================
//
// Fixed enumerations emitted by the rule set and the severity classifier,
// plus their wire spellings.

#pragma once

#include <optional>
#include <set>
#include <string_view>

namespace ghost_bus {

/** @brief Individual anomaly a rule can attach to a report. */
enum class AnomalyTag {
    StaleData,           /**< Report timestamp lags the service clock. */
    StationaryNonStop,   /**< Vehicle has not moved for a sustained period. */
    SpeedSpike,          /**< Speed far above the vehicle's recent mean. */
    SpeedDrop,           /**< Speed far below the vehicle's recent mean. */
    OffRoute             /**< Position outside the configured service area. */
};

/** @brief Set of tags attached to one classification; no duplicates. */
using AnomalyTagSet = std::set<AnomalyTag>;

/** @brief Ordinal summary of a tag set: Info < Warning < Critical. */
enum class Severity {
    Info,
    Warning,
    Critical
};

/** @brief Lifecycle label derived from the ghost flag. */
enum class LifecycleStatus {
    Active,
    Ghost
};

[[nodiscard]] std::string_view to_string(AnomalyTag tag) noexcept;
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(LifecycleStatus status) noexcept;

/** @brief Parse a wire spelling such as "speed_spike". */
[[nodiscard]] std::optional<AnomalyTag> anomaly_tag_from_string(std::string_view text) noexcept;
[[nodiscard]] std::optional<Severity> severity_from_string(std::string_view text) noexcept;

}  // namespace ghost_bus
