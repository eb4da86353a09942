#include "ghost_bus/position_report.hpp"

#include <cmath>

#include <fmt/format.h>

#include "ghost_bus/errors.hpp"

namespace ghost_bus {

namespace {
constexpr double k_max_latitude_deg{90.0};
constexpr double k_max_longitude_deg{180.0};

void require_finite(const char* field, double value) {
    if (!std::isfinite(value)) {
        throw ValidationError(field, "must be a finite number");
    }
}
}  // namespace

HistorySample make_history_sample(const PositionReport& report) noexcept {
    HistorySample sample{};
    sample.latitude_deg = report.latitude_deg;
    sample.longitude_deg = report.longitude_deg;
    sample.timestamp_s = report.timestamp_s;
    sample.speed = report.speed;
    return sample;
}

void validate_report(const PositionReport& report) {
    if (report.vehicle_id.empty()) {
        throw ValidationError("id", "must not be empty");
    }
    if (report.route_id.empty()) {
        throw ValidationError("route_id", "must not be empty");
    }

    require_finite("lat", report.latitude_deg);
    require_finite("lon", report.longitude_deg);
    if (std::abs(report.latitude_deg) > k_max_latitude_deg) {
        throw ValidationError("lat", fmt::format("{} is outside [-90, 90]", report.latitude_deg));
    }
    if (std::abs(report.longitude_deg) > k_max_longitude_deg) {
        throw ValidationError("lon", fmt::format("{} is outside [-180, 180]", report.longitude_deg));
    }

    require_finite("timestamp", report.timestamp_s);
    if (report.speed.has_value()) {
        require_finite("speed", *report.speed);
        if (*report.speed < 0.0) {
            throw ValidationError("speed", "must not be negative");
        }
    }
    if (report.bearing_deg.has_value()) {
        require_finite("bearing", *report.bearing_deg);
    }
}

}  // namespace ghost_bus
