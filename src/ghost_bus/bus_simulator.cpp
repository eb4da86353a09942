#include "ghost_bus/bus_simulator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

#include "ghost_bus/errors.hpp"

namespace ghost_bus {

namespace {
constexpr GeoCoordinate k_denver_origin{39.7392, -104.9903}; /**< Union Station area. */
constexpr double k_orbit_radius_deg{0.01};                    /**< Roughly one kilometre. */
constexpr double k_orbit_period_divisor_s{60.0};              /**< Slow circular drift. */
constexpr double k_ghost_lag_s{300.0};                        /**< Age of replayed ghost reports. */
constexpr double k_min_speed{20.0};
constexpr double k_max_speed{60.0};
constexpr std::chrono::milliseconds k_poll_interval{100};
}  // namespace

BusSimulator::BusSimulator(GhostBusService& service, double update_hz, std::uint32_t seed)
    : service_(service),
      update_hz_(update_hz),
      random_engine_(seed),
      list_buses_{
          SimulatedBus{"WEST_001", "WEST", k_denver_origin, false},
          SimulatedBus{"SOUT_002", "SOUT", k_denver_origin, false},
          SimulatedBus{"NRTH_003", "NRTH", k_denver_origin, false},
          SimulatedBus{"PEGA_004", "PEGA", k_denver_origin, false},
          SimulatedBus{"GHOST_005", "WEST", k_denver_origin, true},
      },
      logger_(get_logger()) {
    if (update_hz_ <= 0.0) {
        throw std::invalid_argument("BusSimulator requires a positive update rate");
    }
}

BusSimulator::~BusSimulator() {
    shutdown();
}

const std::vector<SimulatedBus>& BusSimulator::buses() const noexcept {
    return list_buses_;
}

void BusSimulator::tick(EpochSeconds now_s) {
    for (std::size_t index = 0; index < list_buses_.size(); ++index) {
        const PositionReport report = make_report(index, now_s);
        try {
            const VehicleStatus status = service_.submit(report);
            logger_->debug("Simulated {} -> {}", status.vehicle_id(), to_string(status.lifecycle));
        } catch (const ValidationError& exc) {
            logger_->error("Simulator produced an invalid report for {}: {}", report.vehicle_id, exc.what());
        }
    }
}

void BusSimulator::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting bus simulator at {} Hz", update_hz_);
    update_thread_ = std::thread(&BusSimulator::update_loop, this);
}

void BusSimulator::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Stopping bus simulator");
    if (update_thread_.joinable()) {
        update_thread_.join();
    }
}

/**
 * @brief Fixed-cadence loop; polls the stop flag so shutdown stays prompt.
 */
void BusSimulator::update_loop() {
    const Duration tick_interval{1.0 / update_hz_};
    auto next_tick = std::chrono::steady_clock::now();
    while (flag_running_.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now < next_tick) {
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(next_tick - now, k_poll_interval));
            continue;
        }
        try {
            tick(wall_clock_now_s());
        } catch (const std::exception& exc) {
            logger_->error("Simulator loop error: {}", exc.what());
        }
        next_tick = now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(tick_interval);
    }
}

PositionReport BusSimulator::make_report(std::size_t index, EpochSeconds now_s) {
    const SimulatedBus& bus = list_buses_[index];
    PositionReport report{};
    report.vehicle_id = bus.vehicle_id;
    report.route_id = bus.route_id;

    if (bus.ghost) {
        report.latitude_deg = bus.origin.latitude_deg;
        report.longitude_deg = bus.origin.longitude_deg;
        report.speed = 0.0;
        report.bearing_deg = 0.0;
        report.timestamp_s = now_s - k_ghost_lag_s;
        return report;
    }

    std::uniform_real_distribution<double> speed_distribution{k_min_speed, k_max_speed};
    std::uniform_real_distribution<double> bearing_distribution{0.0, 360.0};
    const double phase = now_s / k_orbit_period_divisor_s + static_cast<double>(index);
    report.latitude_deg = bus.origin.latitude_deg + std::sin(phase) * k_orbit_radius_deg;
    report.longitude_deg = bus.origin.longitude_deg + std::cos(phase) * k_orbit_radius_deg;
    report.speed = speed_distribution(random_engine_);
    report.bearing_deg = bearing_distribution(random_engine_);
    report.timestamp_s = now_s;
    return report;
}

}  // namespace ghost_bus
