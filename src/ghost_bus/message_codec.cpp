#include "ghost_bus/message_codec.hpp"

#include <optional>

#include "ghost_bus/errors.hpp"

namespace ghost_bus {

namespace {
using nlohmann::json;

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    if (!value.has_value()) {
        return nullptr;
    }
    return json(*value);
}

const json& require_field(const json& payload, const char* field) {
    const auto iterator_field = payload.find(field);
    if (iterator_field == payload.end() || iterator_field->is_null()) {
        throw ValidationError(field, "is required");
    }
    return *iterator_field;
}

std::string require_string(const json& payload, const char* field) {
    const json& value = require_field(payload, field);
    if (!value.is_string()) {
        throw ValidationError(field, "must be a string");
    }
    return value.get<std::string>();
}

double require_number(const json& payload, const char* field) {
    const json& value = require_field(payload, field);
    if (!value.is_number()) {
        throw ValidationError(field, "must be a number");
    }
    return value.get<double>();
}

std::optional<double> optional_number(const json& payload, const char* field) {
    const auto iterator_field = payload.find(field);
    if (iterator_field == payload.end() || iterator_field->is_null()) {
        return std::nullopt;
    }
    if (!iterator_field->is_number()) {
        throw ValidationError(field, "must be a number");
    }
    return iterator_field->get<double>();
}

std::optional<std::string> optional_string(const json& payload, const char* field) {
    const auto iterator_field = payload.find(field);
    if (iterator_field == payload.end() || iterator_field->is_null()) {
        return std::nullopt;
    }
    if (!iterator_field->is_string()) {
        throw ValidationError(field, "must be a string");
    }
    return iterator_field->get<std::string>();
}
}  // namespace

json status_to_json(const VehicleStatus& status) {
    json tags = json::array();
    for (const AnomalyTag tag : status.anomaly_tags) {
        tags.push_back(std::string{to_string(tag)});
    }

    const PositionReport& report = status.report;
    return json{
        {"id", report.vehicle_id},
        {"lat", report.latitude_deg},
        {"lon", report.longitude_deg},
        {"route_id", report.route_id},
        {"speed", optional_to_json(report.speed)},
        {"bearing", optional_to_json(report.bearing_deg)},
        {"timestamp", report.timestamp_s},
        {"trip_id", optional_to_json(report.trip_id)},
        {"is_ghost", status.is_ghost},
        {"anomaly_types", std::move(tags)},
        {"severity", std::string{to_string(status.severity)}},
        {"status", std::string{to_string(status.lifecycle)}},
    };
}

json sample_to_json(const HistorySample& sample) {
    return json{
        {"lat", sample.latitude_deg},
        {"lon", sample.longitude_deg},
        {"timestamp", sample.timestamp_s},
        {"speed", optional_to_json(sample.speed)},
    };
}

json statistics_to_json(const VehicleStatistics& statistics) {
    return json{
        {"position_history_count", statistics.position_history_count},
        {"speed_history_count", statistics.speed_history_count},
        {"avg_speed", optional_to_json(statistics.mean_speed)},
        {"total_distance", statistics.total_distance_m},
    };
}

json message_to_json(const FanoutMessage& message) {
    json data;
    if (message.type == MessageType::Snapshot) {
        data = json::array();
        for (const VehicleStatus& status : message.statuses) {
            data.push_back(status_to_json(status));
        }
    } else if (!message.statuses.empty()) {
        data = status_to_json(message.statuses.front());
    }
    return json{{"type", std::string{to_string(message.type)}}, {"data", std::move(data)}};
}

std::string encode_message(const FanoutMessage& message) {
    return message_to_json(message).dump();
}

PositionReport decode_report(const json& payload, EpochSeconds received_at_s) {
    if (!payload.is_object()) {
        throw ValidationError("body", "must be a JSON object");
    }

    PositionReport report{};
    report.vehicle_id = require_string(payload, "id");
    report.latitude_deg = require_number(payload, "lat");
    report.longitude_deg = require_number(payload, "lon");
    report.route_id = require_string(payload, "route_id");
    report.speed = optional_number(payload, "speed");
    report.bearing_deg = optional_number(payload, "bearing");
    report.trip_id = optional_string(payload, "trip_id");
    report.timestamp_s = optional_number(payload, "timestamp").value_or(received_at_s);

    validate_report(report);
    return report;
}

PositionReport decode_report(const std::string& text, EpochSeconds received_at_s) {
    json payload = json::parse(text, nullptr, false);
    if (payload.is_discarded()) {
        throw ValidationError("body", "is not valid JSON");
    }
    return decode_report(payload, received_at_s);
}

}  // namespace ghost_bus
