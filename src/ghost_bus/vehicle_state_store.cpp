#include "ghost_bus/vehicle_state_store.hpp"

#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "ghost_bus/errors.hpp"
#include "ghost_bus/severity_classifier.hpp"

namespace ghost_bus {

VehicleStateStore::VehicleStateStore(DetectorConfig detector_config, StoreConfig store_config, ClockFunction clock)
    : detector_config_(detector_config),
      store_config_(store_config),
      clock_(std::move(clock)),
      rule_set_(detector_config_),
      logger_(get_logger()) {
    if (store_config_.shard_count == 0) {
        throw std::invalid_argument("VehicleStateStore requires at least one shard");
    }
    if (store_config_.history_capacity == 0) {
        throw std::invalid_argument("VehicleStateStore requires a positive history capacity");
    }
    if (!clock_) {
        throw std::invalid_argument("VehicleStateStore requires a clock");
    }
    list_shards_.reserve(store_config_.shard_count);
    for (std::size_t index = 0; index < store_config_.shard_count; ++index) {
        list_shards_.push_back(std::make_unique<Shard>());
    }
}

VehicleStatus VehicleStateStore::apply(const PositionReport& report) {
    validate_report(report);
    const EpochSeconds now_s = clock_();

    while (true) {
        const std::shared_ptr<VehicleEntry> entry = find_or_create_entry(report.vehicle_id);
        std::scoped_lock entry_lock(entry->mutex);
        if (entry->retired) {
            // Reaped between lookup and lock; retry against a fresh entry.
            continue;
        }

        entry->window.record(make_history_sample(report));
        const AnomalyTagSet tags = rule_set_.evaluate(report, entry->window, now_s);

        VehicleStatus status{};
        status.report = report;
        status.anomaly_tags = tags;
        status.is_ghost = is_ghost(tags);
        status.severity = classify_severity(tags);
        status.lifecycle = status.is_ghost ? LifecycleStatus::Ghost : LifecycleStatus::Active;
        status.evaluated_at_s = now_s;

        {
            std::unique_lock commit_lock(commit_mutex_);
            status.sequence = ++commit_sequence_;
            entry->status = std::make_shared<const VehicleStatus>(status);
            notify_listeners(status);
        }

        logger_->debug("{}", to_log_payload({
            {"component", "store"},
            {"vehicle", status.vehicle_id()},
            {"seq", status.sequence},
            {"ghost", status.is_ghost},
            {"severity", std::string{to_string(status.severity)}},
            {"tags", tags.size()},
        }));
        return status;
    }
}

std::optional<VehicleStatus> VehicleStateStore::get(const std::string& vehicle_id) const {
    std::shared_lock commit_lock(commit_mutex_);
    const std::shared_ptr<VehicleEntry> entry = find_entry(vehicle_id);
    if (entry == nullptr || entry->status == nullptr) {
        return std::nullopt;
    }
    return *entry->status;
}

VehicleStatus VehicleStateStore::get_or_throw(const std::string& vehicle_id) const {
    std::optional<VehicleStatus> status = get(vehicle_id);
    if (!status.has_value()) {
        throw NotFoundError(vehicle_id);
    }
    return std::move(*status);
}

std::vector<VehicleStatus> VehicleStateStore::get_all() const {
    std::shared_lock commit_lock(commit_mutex_);
    return collect_statuses();
}

std::optional<VehicleStatistics> VehicleStateStore::statistics(const std::string& vehicle_id) const {
    const std::shared_ptr<VehicleEntry> entry = find_entry(vehicle_id);
    if (entry == nullptr) {
        return std::nullopt;
    }
    std::scoped_lock entry_lock(entry->mutex);
    if (entry->retired || entry->window.empty()) {
        return std::nullopt;
    }
    VehicleStatistics stats{};
    stats.position_history_count = entry->window.size();
    stats.speed_history_count = entry->window.speed_sample_count();
    stats.mean_speed = entry->window.mean_speed();
    stats.total_distance_m = entry->window.cumulative_distance_m();
    return stats;
}

std::size_t VehicleStateStore::size() const {
    std::size_t count = 0;
    for (const auto& shard : list_shards_) {
        std::scoped_lock shard_lock(shard->mutex);
        count += shard->map_entries.size();
    }
    return count;
}

void VehicleStateStore::visit_snapshot(const SnapshotVisitor& visitor) const {
    std::shared_lock commit_lock(commit_mutex_);
    visitor(collect_statuses());
}

VehicleStateStore::ListenerId VehicleStateStore::add_commit_listener(CommitListener listener) {
    if (!listener) {
        throw std::invalid_argument("VehicleStateStore::add_commit_listener requires a callable");
    }
    std::unique_lock commit_lock(commit_mutex_);
    const ListenerId listener_id = next_listener_id_++;
    list_listeners_.emplace_back(listener_id, std::move(listener));
    return listener_id;
}

void VehicleStateStore::remove_commit_listener(ListenerId listener_id) {
    std::unique_lock commit_lock(commit_mutex_);
    list_listeners_.erase(
        std::remove_if(list_listeners_.begin(), list_listeners_.end(), [listener_id](const auto& registered) {
            return registered.first == listener_id;
        }),
        list_listeners_.end()
    );
}

std::size_t VehicleStateStore::reap_expired(EpochSeconds cutoff_s) {
    std::size_t removed = 0;
    std::unique_lock commit_lock(commit_mutex_);
    for (const auto& shard : list_shards_) {
        std::scoped_lock shard_lock(shard->mutex);
        for (auto iterator_entry = shard->map_entries.begin(); iterator_entry != shard->map_entries.end();) {
            VehicleEntry& entry = *iterator_entry->second;
            std::unique_lock entry_lock(entry.mutex, std::try_to_lock);
            const bool expired = entry_lock.owns_lock()
                && (entry.status == nullptr || entry.status->report.timestamp_s < cutoff_s);
            if (!expired) {
                ++iterator_entry;
                continue;
            }
            entry.retired = true;
            entry_lock.unlock();
            iterator_entry = shard->map_entries.erase(iterator_entry);
            ++removed;
        }
    }
    if (removed > 0) {
        logger_->info("{}", to_log_payload({{"component", "store"}, {"event", "reap"}, {"removed", removed}, {"cutoff", cutoff_s}}));
    }
    return removed;
}

VehicleStateStore::Shard& VehicleStateStore::shard_for(const std::string& vehicle_id) const {
    const std::size_t index = std::hash<std::string>{}(vehicle_id) % list_shards_.size();
    return *list_shards_[index];
}

std::shared_ptr<VehicleStateStore::VehicleEntry> VehicleStateStore::find_entry(const std::string& vehicle_id) const {
    Shard& shard = shard_for(vehicle_id);
    std::scoped_lock shard_lock(shard.mutex);
    const auto iterator_entry = shard.map_entries.find(vehicle_id);
    if (iterator_entry == shard.map_entries.end()) {
        return nullptr;
    }
    return iterator_entry->second;
}

std::shared_ptr<VehicleStateStore::VehicleEntry> VehicleStateStore::find_or_create_entry(const std::string& vehicle_id) {
    Shard& shard = shard_for(vehicle_id);
    std::scoped_lock shard_lock(shard.mutex);
    auto& slot = shard.map_entries[vehicle_id];
    if (slot == nullptr) {
        slot = std::make_shared<VehicleEntry>(store_config_.history_capacity);
    }
    return slot;
}

std::vector<VehicleStatus> VehicleStateStore::collect_statuses() const {
    std::vector<VehicleStatus> statuses;
    for (const auto& shard : list_shards_) {
        std::scoped_lock shard_lock(shard->mutex);
        for (const auto& [vehicle_id, entry] : shard->map_entries) {
            if (entry->status != nullptr) {
                statuses.push_back(*entry->status);
            }
        }
    }
    std::sort(statuses.begin(), statuses.end(), [](const VehicleStatus& lhs, const VehicleStatus& rhs) {
        return lhs.vehicle_id() < rhs.vehicle_id();
    });
    return statuses;
}

void VehicleStateStore::notify_listeners(const VehicleStatus& status) {
    for (const auto& [listener_id, listener] : list_listeners_) {
        try {
            listener(status);
        } catch (const std::exception& exc) {
            logger_->error("{}", to_log_payload({
                {"component", "store"},
                {"event", "listener_error"},
                {"listener", listener_id},
                {"error", exc.what()},
            }));
        }
    }
}

}  // namespace ghost_bus
