// === Durable Store ===========================================================
//
// Interface to the external TTL-capable key/value cache that mirrors live
// state across restarts and processes, an in-process implementation of it, and
// the `StatusMirror` adapter the service writes through. The mirror is
// eventually consistent and never a source of truth: every collaborator error
// is logged and swallowed so the classification path keeps running.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ghost_bus/logging.hpp"
#include "ghost_bus/types.hpp"
#include "ghost_bus/vehicle_status.hpp"

namespace ghost_bus {

/** @brief Expiry horizons used by the mirror. */
struct DurableTtlConfig final {
    Duration latest_position{300.0};
    Duration history{3'600.0};
    Duration reference_cache{86'400.0};
    std::size_t history_length{60};
    std::string update_channel{"bus_updates"};
};

/**
 * @brief Minimal key/value + pub/sub surface of the external cache.
 *
 * Implementations throw CollaboratorUnavailable when the backend cannot be
 * reached.
 */
class DurableStore {
  public:
    virtual ~DurableStore() = default;

    virtual void put(const std::string& key, const std::string& value, Duration ttl) = 0;
    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) = 0;
    /** @brief Prepend @p value to a list, trim it to @p max_length, refresh its TTL. */
    virtual void push_history(const std::string& key, const std::string& value, std::size_t max_length, Duration ttl) = 0;
    /** @brief Newest-first list entries, at most @p limit. */
    [[nodiscard]] virtual std::vector<std::string> history(const std::string& key, std::size_t limit) = 0;
    virtual void publish(const std::string& channel, const std::string& payload) = 0;
};

using DurableStorePtr = std::shared_ptr<DurableStore>;

/**
 * @brief Process-local DurableStore with lazy TTL expiry.
 *
 * Used when no external cache is configured and by tests; `set_available`
 * simulates an outage.
 */
class InMemoryDurableStore final : public DurableStore {
  public:
    using Subscriber = std::function<void(const std::string& payload)>;

    explicit InMemoryDurableStore(ClockFunction clock = wall_clock_now_s);

    void put(const std::string& key, const std::string& value, Duration ttl) override;
    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;
    void push_history(const std::string& key, const std::string& value, std::size_t max_length, Duration ttl) override;
    [[nodiscard]] std::vector<std::string> history(const std::string& key, std::size_t limit) override;
    void publish(const std::string& channel, const std::string& payload) override;

    void subscribe(const std::string& channel, Subscriber subscriber);
    void set_available(bool available) noexcept;
    /** @brief Number of live (unexpired) keys across values and lists. */
    [[nodiscard]] std::size_t key_count();

  private:
    struct ValueEntry final {
        std::string value;
        EpochSeconds expires_at_s{};
    };
    struct ListEntry final {
        std::deque<std::string> deque_values;
        EpochSeconds expires_at_s{};
    };

    void ensure_available() const;
    void purge_expired_locked(EpochSeconds now_s);

    ClockFunction clock_;
    std::atomic<bool> flag_available_{true};
    std::mutex mutex_;
    std::map<std::string, ValueEntry> map_values_;
    std::map<std::string, ListEntry> map_lists_;
    std::multimap<std::string, Subscriber> map_subscribers_;
};

/**
 * @brief Best-effort writer of statuses and reference data to a DurableStore.
 *
 * Writes for one vehicle land in commit order: a status whose sequence is not
 * newer than the last one mirrored for that vehicle is dropped. Sequence 0
 * marks a status that never went through the store and is always written.
 */
class StatusMirror final {
  public:
    /** @param store May be null, in which case every call is a no-op. */
    StatusMirror(DurableStorePtr store, DurableTtlConfig config);

    /** @brief Write latest status, append history, publish the update. */
    void mirror(const VehicleStatus& status);
    /** @brief Cache one reference record under `route:<id>`. */
    void cache_route(const std::string& route_id, const std::string& payload);

    [[nodiscard]] bool enabled() const noexcept;
    [[nodiscard]] std::size_t failure_count() const noexcept;

  private:
    void record_failure(const char* operation, const std::string& key, const std::exception& exc);

    DurableStorePtr store_;
    DurableTtlConfig config_;
    std::mutex mutex_;
    std::map<std::string, std::uint64_t> map_last_sequence_;
    std::atomic<std::size_t> failure_count_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

[[nodiscard]] std::string latest_status_key(const std::string& vehicle_id);
[[nodiscard]] std::string history_key(const std::string& vehicle_id);
[[nodiscard]] std::string route_cache_key(const std::string& route_id);

}  // namespace ghost_bus
