// === Bus Simulator ===========================================================
//
// Demo feed that drives the service with synthetic reports for five buses
// circling downtown Denver. One of them replays a five-minute-old position at
// zero speed so the ghost path is exercised end to end.

#pragma once

#include <atomic>
#include <cstdint>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "ghost_bus/ghost_bus_service.hpp"
#include "ghost_bus/logging.hpp"

namespace ghost_bus {

/** @brief Static description of one simulated bus. */
struct SimulatedBus final {
    std::string vehicle_id{};
    std::string route_id{};
    GeoCoordinate origin{};
    bool ghost{};             /**< Replays stale, stationary telemetry. */
};

/** @brief Background thread submitting synthetic reports at a fixed cadence. */
class BusSimulator final {
  public:
    BusSimulator(GhostBusService& service, double update_hz, std::uint32_t seed = std::random_device{}());
    ~BusSimulator();

    BusSimulator(const BusSimulator&) = delete;
    BusSimulator& operator=(const BusSimulator&) = delete;

    [[nodiscard]] const std::vector<SimulatedBus>& buses() const noexcept;

    /** @brief Build and submit one report per bus at @p now_s. */
    void tick(EpochSeconds now_s);
    /** @brief Start the background loop. */
    void run();
    /** @brief Stop and join the background loop. */
    void shutdown();

  private:
    void update_loop();
    [[nodiscard]] PositionReport make_report(std::size_t index, EpochSeconds now_s);

    GhostBusService& service_;
    double update_hz_;
    std::mt19937 random_engine_;
    std::vector<SimulatedBus> list_buses_;
    std::atomic<bool> flag_running_{false};
    std::thread update_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ghost_bus
