#include <cstdint>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "ghost_bus/bus_simulator.hpp"
#include "ghost_bus/errors.hpp"
#include "ghost_bus/ghost_bus_service.hpp"
#include "ghost_bus/message_codec.hpp"
#include "logging_test_fixture.hpp"
#include "test_support.hpp"

using namespace ghost_bus;
using ghost_bus::test::k_fixed_now_s;
using ghost_bus::test::make_report;
using ghost_bus::test::ManualClock;
using ghost_bus::test::RecordingSink;

namespace {

/** @brief Fixed two-route reference source. */
class StaticReference final : public ReferenceDataSource {
  public:
    StaticReference() {
        Route first{};
        first.route_id = "15";
        first.long_name = "East Colfax";
        Route second{};
        second.route_id = "W";
        list_routes_ = {first, second};
    }

    [[nodiscard]] const std::vector<Route>& routes() const override { return list_routes_; }
    [[nodiscard]] const std::vector<Stop>& stops() const override { return list_stops_; }
    [[nodiscard]] std::vector<Trip> trips_for_route(const std::string&) const override { return {}; }
    [[nodiscard]] std::vector<StopTime> stop_times_for_trip(const std::string&) const override { return {}; }
    [[nodiscard]] std::vector<ShapePoint> shape_points(const std::string&) const override { return {}; }

  private:
    std::vector<Route> list_routes_;
    std::vector<Stop> list_stops_;
};

}  // namespace

TEST_CASE("A frozen stale report is classified as a critical ghost") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    GhostBusService service{ServiceConfig{}, nullptr, clock.function()};

    auto sink = std::make_shared<RecordingSink>();
    service.attach(sink);

    service.submit(make_report("B1", 39.73, -104.99, k_fixed_now_s - 300.0, 0.0));

    const VehicleStatus status = service.get("B1");
    REQUIRE(status.is_ghost);
    REQUIRE(status.severity == Severity::Critical);
    REQUIRE(status.lifecycle == LifecycleStatus::Ghost);
    REQUIRE(status.anomaly_tags == AnomalyTagSet{AnomalyTag::StaleData});

    REQUIRE(sink->wait_for_messages(2));
    const auto messages = sink->messages();
    REQUIRE(messages[1].type == MessageType::BusUpdate);
    REQUIRE(messages[1].statuses.front().is_ghost);
}

TEST_CASE("Queries filter by lifecycle and route") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    GhostBusService service{ServiceConfig{}, nullptr, clock.function()};

    service.submit(make_report("ACTIVE_15", 39.7, -105.0, k_fixed_now_s, 25.0, "15"));
    service.submit(make_report("GHOST_15", 39.7, -105.0, k_fixed_now_s - 600.0, 0.0, "15"));
    service.submit(make_report("ACTIVE_W", 39.7, -105.0, k_fixed_now_s, 25.0, "W"));

    REQUIRE(service.get_all().size() == 3);
    REQUIRE(service.vehicle_count() == 3);

    StatusFilter ghosts_only{};
    ghosts_only.show_active = false;
    const auto ghosts = service.get_all(ghosts_only);
    REQUIRE(ghosts.size() == 1);
    REQUIRE(ghosts[0].vehicle_id() == "GHOST_15");

    StatusFilter route_w{};
    route_w.routes = std::set<std::string>{"W"};
    const auto on_w = service.get_all(route_w);
    REQUIRE(on_w.size() == 1);
    REQUIRE(on_w[0].vehicle_id() == "ACTIVE_W");

    StatusFilter nothing{};
    nothing.show_active = false;
    nothing.show_ghost = false;
    REQUIRE(service.get_all(nothing).empty());
}

TEST_CASE("JSON ingestion validates before touching state") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    GhostBusService service{ServiceConfig{}, nullptr, clock.function()};

    REQUIRE_THROWS_AS(service.submit_json(R"({"id":"B1","lat":"north","lon":-105.0,"route_id":"15"})"), ValidationError);
    REQUIRE_THROWS_AS(service.submit_json("{"), ValidationError);
    REQUIRE(service.vehicle_count() == 0);

    const VehicleStatus status = service.submit_json(R"({"id":"B1","lat":39.7,"lon":-105.0,"route_id":"15","speed":20})");
    REQUIRE(status.report.timestamp_s == k_fixed_now_s);
    REQUIRE_FALSE(status.is_ghost);
}

TEST_CASE("Lookups of unknown vehicles raise not-found") {
    ghost_bus::test::ensure_logger_initialized();
    GhostBusService service{ServiceConfig{}};

    REQUIRE_THROWS_AS(service.get("missing"), NotFoundError);
    REQUIRE_THROWS_AS(service.statistics("missing"), NotFoundError);
    REQUIRE_FALSE(service.find("missing").has_value());
}

TEST_CASE("Statistics reflect submitted history") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    GhostBusService service{ServiceConfig{}, nullptr, clock.function()};

    service.submit(make_report("B1", 39.70, -105.0, k_fixed_now_s - 10.0, 10.0));
    service.submit(make_report("B1", 39.71, -105.0, k_fixed_now_s, 20.0));

    const VehicleStatistics stats = service.statistics("B1");
    REQUIRE(stats.position_history_count == 2);
    REQUIRE(stats.speed_history_count == 2);
    REQUIRE(stats.mean_speed == Approx(15.0));
    REQUIRE(stats.total_distance_m == Approx(1111.95).margin(1.0));
}

TEST_CASE("Durable mirror receives every accepted report") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    auto durable = std::make_shared<InMemoryDurableStore>(clock.function());
    GhostBusService service{ServiceConfig{}, durable, clock.function()};

    service.submit(make_report("B1", 39.7, -105.0, k_fixed_now_s, 10.0));
    const auto latest = durable->get("bus:B1");
    REQUIRE(latest.has_value());
    REQUIRE(nlohmann::json::parse(*latest).at("status") == "active");

    service.prime_reference_cache(StaticReference{});
    REQUIRE(nlohmann::json::parse(*durable->get("route:15")).at("route_long_name") == "East Colfax");
    REQUIRE(durable->get("route:W").has_value());

    SECTION("an outage does not block ingestion") {
        durable->set_available(false);
        REQUIRE_NOTHROW(service.submit(make_report("B2", 39.7, -105.0, k_fixed_now_s, 10.0)));
        REQUIRE(service.find("B2").has_value());
        REQUIRE(service.mirror().failure_count() == 3);
    }
}

TEST_CASE("Concurrent reports for one bus leave the mirror matching the store") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    auto durable = std::make_shared<InMemoryDurableStore>(clock.function());
    GhostBusService service{ServiceConfig{}, durable, clock.function()};

    constexpr int k_writer_count{4};
    constexpr int k_reports_per_writer{50};
    std::vector<std::thread> list_writers;
    for (int writer = 0; writer < k_writer_count; ++writer) {
        list_writers.emplace_back([&service, writer]() {
            for (int index = 0; index < k_reports_per_writer; ++index) {
                const double offset_deg = 0.0001 * (writer * k_reports_per_writer + index);
                service.submit(make_report("B1", 39.7 + offset_deg, -105.0, k_fixed_now_s, 10.0 + writer));
            }
        });
    }
    for (std::thread& writer : list_writers) {
        writer.join();
    }

    const VehicleStatus live = service.get("B1");
    REQUIRE(live.sequence == static_cast<std::uint64_t>(k_writer_count * k_reports_per_writer));
    REQUIRE(durable->get(latest_status_key("B1")) == status_to_json(live).dump());

    const auto history = durable->history(history_key("B1"), 1);
    REQUIRE(history.size() == 1);
    REQUIRE(history.front() == sample_to_json(make_history_sample(live.report)).dump());
}

TEST_CASE("Retention reaps vehicles that stopped reporting") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    ServiceConfig config{};
    config.retention = Duration{600.0};
    GhostBusService service{config, nullptr, clock.function()};

    service.submit(make_report("B1", 39.7, -105.0, k_fixed_now_s));
    clock.advance(300.0);
    service.submit(make_report("B2", 39.7, -105.0, clock.now()));
    clock.advance(400.0);

    REQUIRE(service.reap_expired() == 1);
    REQUIRE_FALSE(service.find("B1").has_value());
    REQUIRE(service.find("B2").has_value());
}

TEST_CASE("Retention is disabled by default") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    GhostBusService service{ServiceConfig{}, nullptr, clock.function()};

    service.submit(make_report("B1", 39.7, -105.0, k_fixed_now_s - 100'000.0));
    REQUIRE(service.reap_expired() == 0);
    REQUIRE(service.vehicle_count() == 1);
}

TEST_CASE("Independent services do not share state") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    GhostBusService first{ServiceConfig{}, nullptr, clock.function()};
    GhostBusService second{ServiceConfig{}, nullptr, clock.function()};

    first.submit(make_report("B1", 39.7, -105.0, k_fixed_now_s));
    REQUIRE(first.vehicle_count() == 1);
    REQUIRE(second.vehicle_count() == 0);
}

TEST_CASE("Simulator ticks feed one report per bus") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    GhostBusService service{ServiceConfig{}, nullptr, clock.function()};
    BusSimulator simulator{service, 1.0, 42};

    simulator.tick(k_fixed_now_s);
    REQUIRE(service.vehicle_count() == simulator.buses().size());

    const VehicleStatus ghost = service.get("GHOST_005");
    REQUIRE(ghost.is_ghost);
    REQUIRE(ghost.anomaly_tags.count(AnomalyTag::StaleData) == 1);

    const VehicleStatus moving = service.get("WEST_001");
    REQUIRE_FALSE(moving.is_ghost);
    REQUIRE(moving.report.speed.value() >= 20.0);

    REQUIRE_THROWS_AS(BusSimulator(service, 0.0), std::invalid_argument);
}
