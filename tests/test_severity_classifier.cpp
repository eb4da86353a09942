#include <catch2/catch.hpp>

#include "ghost_bus/severity_classifier.hpp"

using namespace ghost_bus;

TEST_CASE("Severity of an empty tag set is info") {
    REQUIRE(classify_severity({}) == Severity::Info);
    REQUIRE_FALSE(is_ghost({}));
}

TEST_CASE("Critical tags dominate") {
    REQUIRE(classify_severity({AnomalyTag::StaleData}) == Severity::Critical);
    REQUIRE(classify_severity({AnomalyTag::OffRoute}) == Severity::Critical);
    REQUIRE(classify_severity({AnomalyTag::SpeedSpike, AnomalyTag::OffRoute}) == Severity::Critical);
}

TEST_CASE("Movement tags are warnings") {
    REQUIRE(classify_severity({AnomalyTag::SpeedSpike}) == Severity::Warning);
    REQUIRE(classify_severity({AnomalyTag::SpeedDrop}) == Severity::Warning);
    REQUIRE(classify_severity({AnomalyTag::StationaryNonStop}) == Severity::Warning);
    REQUIRE(is_ghost({AnomalyTag::SpeedDrop}));
}

TEST_CASE("Severity levels are totally ordered") {
    REQUIRE(Severity::Info < Severity::Warning);
    REQUIRE(Severity::Warning < Severity::Critical);
}

TEST_CASE("Anomaly vocabulary round-trips through its wire spelling") {
    for (const AnomalyTag tag : {AnomalyTag::StaleData, AnomalyTag::StationaryNonStop, AnomalyTag::SpeedSpike, AnomalyTag::SpeedDrop, AnomalyTag::OffRoute}) {
        REQUIRE(anomaly_tag_from_string(to_string(tag)) == tag);
    }
    REQUIRE(to_string(Severity::Critical) == "critical");
    REQUIRE(severity_from_string("warning") == Severity::Warning);
    REQUIRE_FALSE(anomaly_tag_from_string("teleported").has_value());
}
