#include "ghost_bus/anomaly.hpp"

#include <array>
#include <utility>

namespace ghost_bus {

namespace {
constexpr std::array<std::pair<AnomalyTag, std::string_view>, 5> k_tag_names{{
    {AnomalyTag::StaleData, "stale_data"},
    {AnomalyTag::StationaryNonStop, "stationary_non_stop"},
    {AnomalyTag::SpeedSpike, "speed_spike"},
    {AnomalyTag::SpeedDrop, "speed_drop"},
    {AnomalyTag::OffRoute, "off_route"},
}};

constexpr std::array<std::pair<Severity, std::string_view>, 3> k_severity_names{{
    {Severity::Info, "info"},
    {Severity::Warning, "warning"},
    {Severity::Critical, "critical"},
}};
}  // namespace

std::string_view to_string(AnomalyTag tag) noexcept {
    for (const auto& [candidate, name] : k_tag_names) {
        if (candidate == tag) {
            return name;
        }
    }
    return "unknown";
}

std::string_view to_string(Severity severity) noexcept {
    for (const auto& [candidate, name] : k_severity_names) {
        if (candidate == severity) {
            return name;
        }
    }
    return "unknown";
}

std::string_view to_string(LifecycleStatus status) noexcept {
    return status == LifecycleStatus::Ghost ? "ghost" : "active";
}

std::optional<AnomalyTag> anomaly_tag_from_string(std::string_view text) noexcept {
    for (const auto& [tag, name] : k_tag_names) {
        if (name == text) {
            return tag;
        }
    }
    return std::nullopt;
}

std::optional<Severity> severity_from_string(std::string_view text) noexcept {
    for (const auto& [severity, name] : k_severity_names) {
        if (name == text) {
            return severity;
        }
    }
    return std::nullopt;
}

}  // namespace ghost_bus
