// === Message Codec ===========================================================
//
// JSON wire format for the query and push surfaces, plus the decoder used by
// transports to turn an inbound payload into a validated PositionReport.
//
//   {"type":"snapshot","data":[<status>, ...]}
//   {"type":"bus_update","data":<status>}

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "ghost_bus/fanout_manager.hpp"
#include "ghost_bus/position_report.hpp"
#include "ghost_bus/vehicle_status.hpp"

namespace ghost_bus {

[[nodiscard]] nlohmann::json status_to_json(const VehicleStatus& status);
[[nodiscard]] nlohmann::json sample_to_json(const HistorySample& sample);
[[nodiscard]] nlohmann::json statistics_to_json(const VehicleStatistics& statistics);
[[nodiscard]] nlohmann::json message_to_json(const FanoutMessage& message);

/** @brief Serialize a push message to compact JSON text. */
[[nodiscard]] std::string encode_message(const FanoutMessage& message);

/**
 * @brief Decode and validate an inbound report.
 *
 * `id`, `lat`, `lon` and `route_id` are required; `speed`, `bearing` and
 * `trip_id` may be absent or null. A missing `timestamp` is filled from
 * @p received_at_s.
 *
 * @throws ValidationError on malformed JSON, missing or mistyped fields, or
 *         values rejected by validate_report.
 */
[[nodiscard]] PositionReport decode_report(const nlohmann::json& payload, EpochSeconds received_at_s);
[[nodiscard]] PositionReport decode_report(const std::string& text, EpochSeconds received_at_s);

}  // namespace ghost_bus
