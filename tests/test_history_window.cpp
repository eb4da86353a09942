#include <stdexcept>

#include <catch2/catch.hpp>

#include "ghost_bus/geo_math.hpp"
#include "ghost_bus/history_window.hpp"

using namespace ghost_bus;

namespace {
HistorySample sample_at(double timestamp_s, std::optional<double> speed = std::nullopt, double latitude_deg = 39.0) {
    return HistorySample{latitude_deg, -105.0, timestamp_s, speed};
}
}  // namespace

TEST_CASE("HistoryWindow keeps only the most recent samples") {
    HistoryWindow window{5};
    for (int index = 0; index < 8; ++index) {
        window.record(sample_at(static_cast<double>(index)));
        REQUIRE(window.size() <= window.capacity());
    }

    REQUIRE(window.size() == 5);
    REQUIRE(window.samples().front().timestamp_s == 3.0);
    REQUIRE(window.samples().back().timestamp_s == 7.0);
    REQUIRE(window.latest().timestamp_s == 7.0);
}

TEST_CASE("HistoryWindow defaults to sixty samples") {
    HistoryWindow window{};
    for (int index = 0; index < 75; ++index) {
        window.record(sample_at(static_cast<double>(index)));
    }
    REQUIRE(window.capacity() == k_default_history_capacity);
    REQUIRE(window.size() == 60);
    REQUIRE(window.samples().front().timestamp_s == 15.0);
}

TEST_CASE("HistoryWindow accepts out-of-order timestamps as-is") {
    HistoryWindow window{4};
    window.record(sample_at(10.0));
    window.record(sample_at(5.0));
    window.record(sample_at(5.0));

    REQUIRE(window.size() == 3);
    REQUIRE(window.samples()[0].timestamp_s == 10.0);
    REQUIRE(window.samples()[1].timestamp_s == 5.0);
    REQUIRE(window.samples()[2].timestamp_s == 5.0);
}

TEST_CASE("HistoryWindow tail returns at most the requested samples") {
    HistoryWindow window{10};
    window.record(sample_at(1.0));
    window.record(sample_at(2.0));
    window.record(sample_at(3.0));

    REQUIRE(window.tail(2).size() == 2);
    REQUIRE(window.tail(2).front().timestamp_s == 2.0);
    REQUIRE(window.tail(5).size() == 3);
}

TEST_CASE("HistoryWindow speed aggregates ignore samples without speed") {
    HistoryWindow window{10};
    REQUIRE_FALSE(window.mean_speed().has_value());

    window.record(sample_at(1.0, 10.0));
    window.record(sample_at(2.0));
    window.record(sample_at(3.0, 30.0));
    window.record(sample_at(4.0, 50.0));

    REQUIRE(window.speed_sample_count() == 3);
    REQUIRE(window.mean_speed().value() == Approx(30.0));
    REQUIRE(window.mean_speed_before_latest().value() == Approx(20.0));
}

TEST_CASE("HistoryWindow cumulative distance sums consecutive legs") {
    HistoryWindow window{10};
    window.record(sample_at(1.0, std::nullopt, 39.0));
    window.record(sample_at(2.0, std::nullopt, 39.001));
    window.record(sample_at(3.0, std::nullopt, 39.0));

    const double leg_m = haversine_distance_m(39.0, -105.0, 39.001, -105.0);
    REQUIRE(window.cumulative_distance_m() == Approx(2.0 * leg_m));
}

TEST_CASE("HistoryWindow rejects zero capacity") {
    REQUIRE_THROWS_AS(HistoryWindow{0}, std::invalid_argument);
}
