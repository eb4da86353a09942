// === Ghost Bus Service =======================================================
//
// Lifecycle-scoped facade that owns the state store, the fan-out manager and
// the durable mirror. Transports call `submit`/`submit_json` for ingestion,
// `get`/`get_all`/`statistics` for queries, and `attach`/`detach` for push
// subscriptions. Several services can coexist in one process.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ghost_bus/anomaly_rules.hpp"
#include "ghost_bus/durable_store.hpp"
#include "ghost_bus/fanout_manager.hpp"
#include "ghost_bus/gtfs_reference_loader.hpp"
#include "ghost_bus/logging.hpp"
#include "ghost_bus/vehicle_state_store.hpp"

namespace ghost_bus {

/**
 * @brief Runtime knobs for the classification core and its delivery layer.
 *
 * Populated by ConfigurationLoader; treated as immutable once the service is
 * constructed.
 */
struct ServiceConfig final {
    DetectorConfig detector{};
    StoreConfig store{};
    FanoutConfig fanout{};
    DurableTtlConfig durable{};
    Duration retention{0.0};  /**< Reaping horizon; zero keeps every vehicle forever. */
};

/** @brief Owns and wires the live vehicle-state pipeline. */
class GhostBusService final {
  public:
    /**
     * @param durable_store Optional external mirror; null runs in-memory only.
     * @param clock Source of "now" for classification and reaping.
     */
    GhostBusService(ServiceConfig config, DurableStorePtr durable_store = nullptr, ClockFunction clock = wall_clock_now_s);
    ~GhostBusService();

    GhostBusService(const GhostBusService&) = delete;
    GhostBusService& operator=(const GhostBusService&) = delete;

    /**
     * @brief Validate, classify, store, broadcast and mirror one report.
     * @throws ValidationError if the report is rejected.
     */
    VehicleStatus submit(const PositionReport& report);
    /** @brief Decode a JSON payload and submit it. */
    VehicleStatus submit_json(const std::string& payload);

    /** @throws NotFoundError for unknown ids. */
    [[nodiscard]] VehicleStatus get(const std::string& vehicle_id) const;
    [[nodiscard]] std::optional<VehicleStatus> find(const std::string& vehicle_id) const;
    [[nodiscard]] std::vector<VehicleStatus> get_all() const;
    [[nodiscard]] std::vector<VehicleStatus> get_all(const StatusFilter& filter) const;
    /** @throws NotFoundError for unknown ids. */
    [[nodiscard]] VehicleStatistics statistics(const std::string& vehicle_id) const;

    ConnectionId attach(ObserverSinkPtr sink);
    void detach(ConnectionId connection_id);
    [[nodiscard]] std::size_t connection_count() const;
    [[nodiscard]] std::size_t vehicle_count() const;

    /** @brief Cache every route of @p reference in the durable mirror. */
    void prime_reference_cache(const ReferenceDataSource& reference);
    /** @brief Apply the configured retention horizon; no-op when disabled. */
    std::size_t reap_expired();

    [[nodiscard]] const ServiceConfig& config() const noexcept;
    [[nodiscard]] const StatusMirror& mirror() const noexcept;

    /** @brief Detach observers and join their delivery threads. */
    void shutdown();

  private:
    ServiceConfig config_;
    ClockFunction clock_;
    VehicleStateStore store_;
    FanoutManager fanout_;
    StatusMirror mirror_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ghost_bus
