#include "ghost_bus/severity_classifier.hpp"

#include <algorithm>
#include <array>

namespace ghost_bus {

namespace {
constexpr std::array<AnomalyTag, 2> k_critical_tags{AnomalyTag::StaleData, AnomalyTag::OffRoute};
constexpr std::array<AnomalyTag, 3> k_warning_tags{
    AnomalyTag::StationaryNonStop,
    AnomalyTag::SpeedSpike,
    AnomalyTag::SpeedDrop,
};

template <std::size_t N>
bool intersects(const AnomalyTagSet& tags, const std::array<AnomalyTag, N>& candidates) {
    return std::any_of(candidates.begin(), candidates.end(), [&tags](AnomalyTag tag) {
        return tags.count(tag) > 0;
    });
}
}  // namespace

Severity classify_severity(const AnomalyTagSet& tags) {
    if (tags.empty()) {
        return Severity::Info;
    }
    if (intersects(tags, k_critical_tags)) {
        return Severity::Critical;
    }
    if (intersects(tags, k_warning_tags)) {
        return Severity::Warning;
    }
    return Severity::Info;
}

}  // namespace ghost_bus
