#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "ghost_bus/durable_store.hpp"
#include "ghost_bus/errors.hpp"
#include "logging_test_fixture.hpp"
#include "test_support.hpp"

using namespace ghost_bus;
using ghost_bus::test::k_fixed_now_s;
using ghost_bus::test::make_report;
using ghost_bus::test::ManualClock;

namespace {
VehicleStatus make_status(const std::string& vehicle_id, EpochSeconds timestamp_s, std::uint64_t sequence = 0) {
    VehicleStatus status{};
    status.report = make_report(vehicle_id, 39.7, -105.0, timestamp_s, 12.0);
    status.sequence = sequence;
    return status;
}
}  // namespace

TEST_CASE("Durable keys follow the cache layout") {
    REQUIRE(latest_status_key("B1") == "bus:B1");
    REQUIRE(history_key("B1") == "bus:B1:history");
    REQUIRE(route_cache_key("15") == "route:15");
}

TEST_CASE("In-memory store expires values after their TTL") {
    ManualClock clock{};
    InMemoryDurableStore store{clock.function()};

    store.put("k", "v", Duration{10.0});
    REQUIRE(store.get("k") == std::string{"v"});
    clock.advance(9.0);
    REQUIRE(store.get("k").has_value());
    clock.advance(1.0);
    REQUIRE_FALSE(store.get("k").has_value());
    REQUIRE(store.key_count() == 0);
}

TEST_CASE("History lists are newest first and trimmed") {
    ManualClock clock{};
    InMemoryDurableStore store{clock.function()};

    for (int index = 0; index < 5; ++index) {
        store.push_history("h", std::to_string(index), 3, Duration{60.0});
    }
    REQUIRE(store.history("h", 10) == std::vector<std::string>{"4", "3", "2"});
    REQUIRE(store.history("h", 1) == std::vector<std::string>{"4"});
    REQUIRE(store.history("missing", 10).empty());

    clock.advance(61.0);
    REQUIRE(store.history("h", 10).empty());
}

TEST_CASE("Publish reaches channel subscribers only") {
    InMemoryDurableStore store{};
    std::vector<std::string> list_received;
    std::vector<std::string> list_other;
    store.subscribe("bus_updates", [&](const std::string& payload) { list_received.push_back(payload); });
    store.subscribe("other", [&](const std::string& payload) { list_other.push_back(payload); });

    store.publish("bus_updates", "hello");
    REQUIRE(list_received == std::vector<std::string>{"hello"});
    REQUIRE(list_other.empty());
}

TEST_CASE("An unavailable store throws on every call") {
    InMemoryDurableStore store{};
    store.set_available(false);
    REQUIRE_THROWS_AS(store.put("k", "v", Duration{1.0}), CollaboratorUnavailable);
    REQUIRE_THROWS_AS(store.get("k"), CollaboratorUnavailable);
    REQUIRE_THROWS_AS(store.publish("c", "p"), CollaboratorUnavailable);
}

TEST_CASE("Mirror writes latest status, history and an update") {
    ghost_bus::test::ensure_logger_initialized();
    ManualClock clock{};
    auto store = std::make_shared<InMemoryDurableStore>(clock.function());
    std::vector<std::string> list_published;
    store->subscribe("bus_updates", [&](const std::string& payload) { list_published.push_back(payload); });

    StatusMirror mirror{store, DurableTtlConfig{}};
    REQUIRE(mirror.enabled());
    mirror.mirror(make_status("B1", k_fixed_now_s - 1.0));
    mirror.mirror(make_status("B1", k_fixed_now_s));

    const auto latest = store->get("bus:B1");
    REQUIRE(latest.has_value());
    REQUIRE(nlohmann::json::parse(*latest).at("timestamp") == k_fixed_now_s);

    const auto history = store->history("bus:B1:history", 60);
    REQUIRE(history.size() == 2);
    REQUIRE(nlohmann::json::parse(history.front()).at("timestamp") == k_fixed_now_s);

    REQUIRE(list_published.size() == 2);
    REQUIRE(mirror.failure_count() == 0);

    SECTION("latest position expires after five minutes") {
        clock.advance(301.0);
        REQUIRE_FALSE(store->get("bus:B1").has_value());
        REQUIRE(store->history("bus:B1:history", 60).size() == 2);
    }
}

TEST_CASE("Mirror history is capped at the configured length") {
    ghost_bus::test::ensure_logger_initialized();
    auto store = std::make_shared<InMemoryDurableStore>();
    DurableTtlConfig config{};
    config.history_length = 5;
    StatusMirror mirror{store, config};

    for (int index = 0; index < 12; ++index) {
        mirror.mirror(make_status("B1", k_fixed_now_s + index));
    }
    REQUIRE(store->history(history_key("B1"), 100).size() == 5);
}

TEST_CASE("Mirror degrades quietly when the store is down") {
    ghost_bus::test::ensure_logger_initialized();
    auto store = std::make_shared<InMemoryDurableStore>();
    StatusMirror mirror{store, DurableTtlConfig{}};
    store->set_available(false);

    REQUIRE_NOTHROW(mirror.mirror(make_status("B1", k_fixed_now_s)));
    REQUIRE(mirror.failure_count() == 3);
    REQUIRE_NOTHROW(mirror.cache_route("15", "{}"));
    REQUIRE(mirror.failure_count() == 4);

    store->set_available(true);
    mirror.mirror(make_status("B1", k_fixed_now_s));
    REQUIRE(mirror.failure_count() == 4);
    REQUIRE(store->get("bus:B1").has_value());
}

TEST_CASE("Mirror keeps the newest committed status when writes arrive late") {
    ghost_bus::test::ensure_logger_initialized();
    auto store = std::make_shared<InMemoryDurableStore>();
    std::vector<std::string> list_published;
    store->subscribe("bus_updates", [&](const std::string& payload) { list_published.push_back(payload); });
    StatusMirror mirror{store, DurableTtlConfig{}};

    mirror.mirror(make_status("B1", k_fixed_now_s, 7));
    mirror.mirror(make_status("B1", k_fixed_now_s - 5.0, 4));
    mirror.mirror(make_status("B1", k_fixed_now_s - 1.0, 7));

    REQUIRE(nlohmann::json::parse(*store->get("bus:B1")).at("timestamp") == k_fixed_now_s);
    REQUIRE(store->history(history_key("B1"), 60).size() == 1);
    REQUIRE(list_published.size() == 1);

    // Ordering is tracked per vehicle.
    mirror.mirror(make_status("B2", k_fixed_now_s, 5));
    REQUIRE(store->get("bus:B2").has_value());

    mirror.mirror(make_status("B1", k_fixed_now_s + 1.0, 8));
    REQUIRE(nlohmann::json::parse(*store->get("bus:B1")).at("timestamp") == k_fixed_now_s + 1.0);
    REQUIRE(mirror.failure_count() == 0);
}

TEST_CASE("A mirror without a store is a no-op") {
    ghost_bus::test::ensure_logger_initialized();
    StatusMirror mirror{nullptr, DurableTtlConfig{}};
    REQUIRE_FALSE(mirror.enabled());
    REQUIRE_NOTHROW(mirror.mirror(make_status("B1", k_fixed_now_s)));
    REQUIRE(mirror.failure_count() == 0);
}
