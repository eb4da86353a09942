#include "ghost_bus/durable_store.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

#include <nlohmann/json.hpp>

#include "ghost_bus/errors.hpp"
#include "ghost_bus/message_codec.hpp"

namespace ghost_bus {

std::string latest_status_key(const std::string& vehicle_id) {
    return "bus:" + vehicle_id;
}

std::string history_key(const std::string& vehicle_id) {
    return "bus:" + vehicle_id + ":history";
}

std::string route_cache_key(const std::string& route_id) {
    return "route:" + route_id;
}

// --- InMemoryDurableStore ----------------------------------------------------

InMemoryDurableStore::InMemoryDurableStore(ClockFunction clock)
    : clock_(std::move(clock)) {}

void InMemoryDurableStore::put(const std::string& key, const std::string& value, Duration ttl) {
    ensure_available();
    std::scoped_lock lock(mutex_);
    map_values_[key] = ValueEntry{value, clock_() + ttl.count()};
}

std::optional<std::string> InMemoryDurableStore::get(const std::string& key) {
    ensure_available();
    std::scoped_lock lock(mutex_);
    purge_expired_locked(clock_());
    const auto iterator_value = map_values_.find(key);
    if (iterator_value == map_values_.end()) {
        return std::nullopt;
    }
    return iterator_value->second.value;
}

void InMemoryDurableStore::push_history(const std::string& key, const std::string& value, std::size_t max_length, Duration ttl) {
    ensure_available();
    std::scoped_lock lock(mutex_);
    const EpochSeconds now_s = clock_();
    purge_expired_locked(now_s);
    ListEntry& entry = map_lists_[key];
    entry.deque_values.push_front(value);
    while (entry.deque_values.size() > max_length) {
        entry.deque_values.pop_back();
    }
    entry.expires_at_s = now_s + ttl.count();
}

std::vector<std::string> InMemoryDurableStore::history(const std::string& key, std::size_t limit) {
    ensure_available();
    std::scoped_lock lock(mutex_);
    purge_expired_locked(clock_());
    const auto iterator_list = map_lists_.find(key);
    if (iterator_list == map_lists_.end()) {
        return {};
    }
    const std::deque<std::string>& values = iterator_list->second.deque_values;
    const std::size_t take = std::min(limit, values.size());
    return std::vector<std::string>(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(take));
}

void InMemoryDurableStore::publish(const std::string& channel, const std::string& payload) {
    ensure_available();
    std::vector<Subscriber> list_targets;
    {
        std::scoped_lock lock(mutex_);
        const auto [first, last] = map_subscribers_.equal_range(channel);
        for (auto iterator_subscriber = first; iterator_subscriber != last; ++iterator_subscriber) {
            list_targets.push_back(iterator_subscriber->second);
        }
    }
    for (const Subscriber& subscriber : list_targets) {
        subscriber(payload);
    }
}

void InMemoryDurableStore::subscribe(const std::string& channel, Subscriber subscriber) {
    std::scoped_lock lock(mutex_);
    map_subscribers_.emplace(channel, std::move(subscriber));
}

void InMemoryDurableStore::set_available(bool available) noexcept {
    flag_available_.store(available);
}

std::size_t InMemoryDurableStore::key_count() {
    std::scoped_lock lock(mutex_);
    purge_expired_locked(clock_());
    return map_values_.size() + map_lists_.size();
}

void InMemoryDurableStore::ensure_available() const {
    if (!flag_available_.load()) {
        throw CollaboratorUnavailable("durable store is unavailable");
    }
}

void InMemoryDurableStore::purge_expired_locked(EpochSeconds now_s) {
    for (auto iterator_value = map_values_.begin(); iterator_value != map_values_.end();) {
        iterator_value = iterator_value->second.expires_at_s <= now_s ? map_values_.erase(iterator_value) : std::next(iterator_value);
    }
    for (auto iterator_list = map_lists_.begin(); iterator_list != map_lists_.end();) {
        iterator_list = iterator_list->second.expires_at_s <= now_s ? map_lists_.erase(iterator_list) : std::next(iterator_list);
    }
}

// --- StatusMirror ------------------------------------------------------------

StatusMirror::StatusMirror(DurableStorePtr store, DurableTtlConfig config)
    : store_(std::move(store)),
      config_(std::move(config)),
      logger_(get_logger()) {}

void StatusMirror::mirror(const VehicleStatus& status) {
    if (store_ == nullptr) {
        return;
    }
    const std::string& vehicle_id = status.vehicle_id();
    const std::string payload = status_to_json(status).dump();

    // Held across the writes so concurrent submits for one vehicle cannot interleave.
    std::scoped_lock lock(mutex_);
    if (status.sequence != 0) {
        std::uint64_t& last_sequence = map_last_sequence_[vehicle_id];
        if (status.sequence <= last_sequence) {
            logger_->debug("{}", to_log_payload({
                {"component", "mirror"},
                {"event", "superseded"},
                {"vehicle", vehicle_id},
                {"seq", status.sequence},
                {"mirrored_seq", last_sequence},
            }));
            return;
        }
        last_sequence = status.sequence;
    }

    try {
        store_->put(latest_status_key(vehicle_id), payload, config_.latest_position);
    } catch (const std::exception& exc) {
        record_failure("put", latest_status_key(vehicle_id), exc);
    }
    try {
        const std::string sample = sample_to_json(make_history_sample(status.report)).dump();
        store_->push_history(history_key(vehicle_id), sample, config_.history_length, config_.history);
    } catch (const std::exception& exc) {
        record_failure("push_history", history_key(vehicle_id), exc);
    }
    try {
        store_->publish(config_.update_channel, payload);
    } catch (const std::exception& exc) {
        record_failure("publish", config_.update_channel, exc);
    }
}

void StatusMirror::cache_route(const std::string& route_id, const std::string& payload) {
    if (store_ == nullptr) {
        return;
    }
    try {
        store_->put(route_cache_key(route_id), payload, config_.reference_cache);
    } catch (const std::exception& exc) {
        record_failure("put", route_cache_key(route_id), exc);
    }
}

bool StatusMirror::enabled() const noexcept {
    return store_ != nullptr;
}

std::size_t StatusMirror::failure_count() const noexcept {
    return failure_count_.load();
}

void StatusMirror::record_failure(const char* operation, const std::string& key, const std::exception& exc) {
    const std::size_t failures = ++failure_count_;
    logger_->warn("{}", to_log_payload({
        {"component", "mirror"},
        {"operation", operation},
        {"key", key},
        {"failures", failures},
        {"error", exc.what()},
    }));
}

}  // namespace ghost_bus
