#include "ghost_bus/ghost_bus_service.hpp"

#include <algorithm>
#include <utility>

#include <nlohmann/json.hpp>

#include "ghost_bus/errors.hpp"
#include "ghost_bus/message_codec.hpp"
#include "ghost_bus/version.hpp"

namespace ghost_bus {

GhostBusService::GhostBusService(ServiceConfig config, DurableStorePtr durable_store, ClockFunction clock)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      store_(config_.detector, config_.store, clock_),
      fanout_(store_, config_.fanout),
      mirror_(std::move(durable_store), config_.durable),
      logger_(get_logger()) {
    logger_->info(
        "ghost_bus {} service ready: history_capacity={} shards={} queue_capacity={} durable_mirror={}",
        k_version,
        config_.store.history_capacity,
        config_.store.shard_count,
        config_.fanout.queue_capacity,
        mirror_.enabled() ? "on" : "off"
    );
}

GhostBusService::~GhostBusService() {
    shutdown();
}

VehicleStatus GhostBusService::submit(const PositionReport& report) {
    try {
        validate_report(report);
    } catch (const ValidationError& exc) {
        logger_->warn("{}", to_log_payload({
            {"component", "ingest"},
            {"event", "rejected"},
            {"vehicle", report.vehicle_id},
            {"field", exc.field()},
            {"error", exc.what()},
        }));
        throw;
    }

    VehicleStatus status = store_.apply(report);
    mirror_.mirror(status);
    return status;
}

VehicleStatus GhostBusService::submit_json(const std::string& payload) {
    PositionReport report{};
    try {
        report = decode_report(payload, clock_());
    } catch (const ValidationError& exc) {
        logger_->warn("{}", to_log_payload({
            {"component", "ingest"},
            {"event", "rejected"},
            {"field", exc.field()},
            {"error", exc.what()},
        }));
        throw;
    }
    return submit(report);
}

VehicleStatus GhostBusService::get(const std::string& vehicle_id) const {
    return store_.get_or_throw(vehicle_id);
}

std::optional<VehicleStatus> GhostBusService::find(const std::string& vehicle_id) const {
    return store_.get(vehicle_id);
}

std::vector<VehicleStatus> GhostBusService::get_all() const {
    return store_.get_all();
}

std::vector<VehicleStatus> GhostBusService::get_all(const StatusFilter& filter) const {
    std::vector<VehicleStatus> statuses = store_.get_all();
    statuses.erase(
        std::remove_if(statuses.begin(), statuses.end(), [&filter](const VehicleStatus& status) {
            return !filter.accepts(status);
        }),
        statuses.end()
    );
    return statuses;
}

VehicleStatistics GhostBusService::statistics(const std::string& vehicle_id) const {
    std::optional<VehicleStatistics> stats = store_.statistics(vehicle_id);
    if (!stats.has_value()) {
        throw NotFoundError(vehicle_id);
    }
    return *stats;
}

ConnectionId GhostBusService::attach(ObserverSinkPtr sink) {
    return fanout_.attach(std::move(sink));
}

void GhostBusService::detach(ConnectionId connection_id) {
    fanout_.detach(connection_id);
}

std::size_t GhostBusService::connection_count() const {
    return fanout_.connection_count();
}

std::size_t GhostBusService::vehicle_count() const {
    return store_.size();
}

void GhostBusService::prime_reference_cache(const ReferenceDataSource& reference) {
    if (!mirror_.enabled()) {
        return;
    }
    for (const Route& route : reference.routes()) {
        const nlohmann::json payload{
            {"route_id", route.route_id},
            {"route_short_name", route.short_name},
            {"route_long_name", route.long_name},
            {"route_type", route.route_type},
            {"route_color", route.color},
            {"route_text_color", route.text_color},
        };
        mirror_.cache_route(route.route_id, payload.dump());
    }
    logger_->info("Cached {} routes in the durable mirror", reference.routes().size());
}

std::size_t GhostBusService::reap_expired() {
    if (config_.retention.count() <= 0.0) {
        return 0;
    }
    return store_.reap_expired(clock_() - config_.retention.count());
}

const ServiceConfig& GhostBusService::config() const noexcept {
    return config_;
}

const StatusMirror& GhostBusService::mirror() const noexcept {
    return mirror_;
}

void GhostBusService::shutdown() {
    fanout_.shutdown();
}

}  // namespace ghost_bus
