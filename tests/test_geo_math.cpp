#include <catch2/catch.hpp>

#include "ghost_bus/geo_math.hpp"

using namespace ghost_bus;

TEST_CASE("Haversine distance of a point to itself is zero") {
    const GeoCoordinate points[] = {
        {39.7392, -104.9903},
        {0.0, 0.0},
        {-89.9, 179.9},
        {90.0, -180.0},
    };
    for (const GeoCoordinate& point : points) {
        REQUIRE(haversine_distance_m(point, point) == 0.0);
    }
}

TEST_CASE("Haversine distance is symmetric") {
    const GeoCoordinate denver{39.7392, -104.9903};
    const GeoCoordinate boulder{40.0150, -105.2705};
    const GeoCoordinate sydney{-33.8688, 151.2093};

    REQUIRE(haversine_distance_m(denver, boulder) == haversine_distance_m(boulder, denver));
    REQUIRE(haversine_distance_m(denver, sydney) == haversine_distance_m(sydney, denver));
}

TEST_CASE("Haversine distance matches known reference values") {
    // One degree of latitude on a 6371 km sphere.
    REQUIRE(haversine_distance_m(0.0, 0.0, 1.0, 0.0) == Approx(111'194.93).epsilon(1e-6));
    // Denver to Boulder is roughly 38.9 km.
    REQUIRE(haversine_distance_m(39.7392, -104.9903, 40.0150, -105.2705) == Approx(38'887.0).margin(5.0));
    // Antipodal points are half the circumference apart.
    REQUIRE(haversine_distance_m(0.0, 0.0, 0.0, 180.0) == Approx(k_earth_radius_m * 3.141592653589793).epsilon(1e-9));
}
