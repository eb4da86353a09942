#include <string>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "ghost_bus/errors.hpp"
#include "ghost_bus/message_codec.hpp"
#include "test_support.hpp"

using namespace ghost_bus;
using ghost_bus::test::make_report;
using nlohmann::json;

namespace {
VehicleStatus make_ghost_status() {
    VehicleStatus status{};
    status.report = make_report("B1", 39.73, -104.99, 1000.0, 0.0);
    status.anomaly_tags = {AnomalyTag::StaleData, AnomalyTag::SpeedDrop};
    status.is_ghost = true;
    status.severity = Severity::Critical;
    status.lifecycle = LifecycleStatus::Ghost;
    status.sequence = 7;
    return status;
}

std::string field_of(const std::string& text) {
    try {
        (void)decode_report(text, 500.0);
    } catch (const ValidationError& exc) {
        return exc.field();
    }
    return "<none>";
}
}  // namespace

TEST_CASE("Statuses encode with the published field names") {
    const json encoded = status_to_json(make_ghost_status());

    REQUIRE(encoded.at("id") == "B1");
    REQUIRE(encoded.at("lat") == 39.73);
    REQUIRE(encoded.at("lon") == -104.99);
    REQUIRE(encoded.at("route_id") == "R1");
    REQUIRE(encoded.at("speed") == 0.0);
    REQUIRE(encoded.at("bearing").is_null());
    REQUIRE(encoded.at("trip_id").is_null());
    REQUIRE(encoded.at("timestamp") == 1000.0);
    REQUIRE(encoded.at("is_ghost") == true);
    REQUIRE(encoded.at("severity") == "critical");
    REQUIRE(encoded.at("status") == "ghost");
    REQUIRE(encoded.at("anomaly_types") == json::array({"stale_data", "speed_drop"}));
}

TEST_CASE("Push messages carry a type and data") {
    const VehicleStatus status = make_ghost_status();

    const json update = json::parse(encode_message(*make_update_message(status)));
    REQUIRE(update.at("type") == "bus_update");
    REQUIRE(update.at("data").is_object());
    REQUIRE(update.at("data").at("id") == "B1");

    const json snapshot = message_to_json(*make_snapshot_message({status, status}));
    REQUIRE(snapshot.at("type") == "snapshot");
    REQUIRE(snapshot.at("data").is_array());
    REQUIRE(snapshot.at("data").size() == 2);

    const json empty = message_to_json(*make_snapshot_message({}));
    REQUIRE(empty.at("data") == json::array());
}

TEST_CASE("Statistics and samples encode their aggregates") {
    VehicleStatistics stats{};
    stats.position_history_count = 3;
    stats.speed_history_count = 0;
    stats.total_distance_m = 12.5;
    const json encoded = statistics_to_json(stats);
    REQUIRE(encoded.at("position_history_count") == 3);
    REQUIRE(encoded.at("speed_history_count") == 0);
    REQUIRE(encoded.at("avg_speed").is_null());
    REQUIRE(encoded.at("total_distance") == 12.5);

    const json sample = sample_to_json(HistorySample{39.0, -105.0, 10.0, 4.0});
    REQUIRE(sample.at("speed") == 4.0);
    REQUIRE(sample.at("timestamp") == 10.0);
}

TEST_CASE("Inbound reports decode with optional fields") {
    const PositionReport report = decode_report(
        std::string{R"({"id":"B9","lat":39.7,"lon":-105.0,"route_id":"15","speed":22.5,"bearing":90,"trip_id":"T1","timestamp":1234.5})"},
        500.0
    );
    REQUIRE(report.vehicle_id == "B9");
    REQUIRE(report.route_id == "15");
    REQUIRE(report.speed == 22.5);
    REQUIRE(report.bearing_deg == 90.0);
    REQUIRE(report.trip_id == std::string{"T1"});
    REQUIRE(report.timestamp_s == 1234.5);
}

TEST_CASE("A missing timestamp defaults to the receive time") {
    const json payload = {{"id", "B9"}, {"lat", 39.7}, {"lon", -105.0}, {"route_id", "15"}, {"speed", nullptr}};
    const PositionReport report = decode_report(payload, 500.0);
    REQUIRE(report.timestamp_s == 500.0);
    REQUIRE_FALSE(report.speed.has_value());
    REQUIRE_FALSE(report.trip_id.has_value());
}

TEST_CASE("Malformed inbound reports are rejected by field") {
    REQUIRE(field_of("not json") == "body");
    REQUIRE(field_of("[1,2]") == "body");
    REQUIRE(field_of(R"({"lat":39.7,"lon":-105.0,"route_id":"15"})") == "id");
    REQUIRE(field_of(R"({"id":"B1","lat":"39.7","lon":-105.0,"route_id":"15"})") == "lat");
    REQUIRE(field_of(R"({"id":"B1","lat":39.7,"lon":-105.0})") == "route_id");
    REQUIRE(field_of(R"({"id":"B1","lat":39.7,"lon":-105.0,"route_id":"15","speed":"fast"})") == "speed");
    REQUIRE(field_of(R"({"id":"B1","lat":95.0,"lon":-105.0,"route_id":"15"})") == "lat");
    REQUIRE(field_of(R"({"id":"B1","lat":39.7,"lon":-105.0,"route_id":"15","speed":-1})") == "speed");
    REQUIRE(field_of(R"({"id":"","lat":39.7,"lon":-105.0,"route_id":"15"})") == "id");
}
