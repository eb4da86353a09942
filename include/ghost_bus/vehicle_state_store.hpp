// === Vehicle State Store =====================================================
//
// Authoritative map of vehicle id -> latest enriched status. `apply` is the
// single write path: record the sample, run the rule set, classify, and
// publish the replacement status.
//
// Concurrency
// - Entries live in hash-sharded maps; the shard lock is held only long
//   enough to find or create an entry.
// - Each entry carries its own mutex, so applies for one vehicle serialize
//   while different vehicles classify in parallel.
// - Publishing a finished status takes `commit_mutex_` exclusively for a few
//   pointer swaps plus listener notification. Readers take it shared, which
//   makes `get_all` a point-in-time view and gives commits a global order.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ghost_bus/anomaly_rules.hpp"
#include "ghost_bus/history_window.hpp"
#include "ghost_bus/logging.hpp"
#include "ghost_bus/position_report.hpp"
#include "ghost_bus/vehicle_status.hpp"

namespace ghost_bus {

/** @brief Sizing knobs for the store. */
struct StoreConfig final {
    std::size_t history_capacity{k_default_history_capacity};
    std::size_t shard_count{16};
};

/** @brief Sharded, per-vehicle serialized status store. */
class VehicleStateStore final {
  public:
    using CommitListener = std::function<void(const VehicleStatus&)>;
    using ListenerId = std::uint64_t;
    using SnapshotVisitor = std::function<void(const std::vector<VehicleStatus>&)>;

    VehicleStateStore(DetectorConfig detector_config, StoreConfig store_config, ClockFunction clock = wall_clock_now_s);

    VehicleStateStore(const VehicleStateStore&) = delete;
    VehicleStateStore& operator=(const VehicleStateStore&) = delete;

    /**
     * @brief Classify @p report and replace the vehicle's status.
     *
     * @throws ValidationError if the report is malformed; state is untouched.
     */
    VehicleStatus apply(const PositionReport& report);

    /** @brief Latest status for @p vehicle_id, if one was ever committed. */
    [[nodiscard]] std::optional<VehicleStatus> get(const std::string& vehicle_id) const;
    /** @throws NotFoundError for unknown ids. */
    [[nodiscard]] VehicleStatus get_or_throw(const std::string& vehicle_id) const;
    /** @brief Point-in-time copy of every committed status, ordered by id. */
    [[nodiscard]] std::vector<VehicleStatus> get_all() const;
    /** @brief Aggregates over the vehicle's history window. */
    [[nodiscard]] std::optional<VehicleStatistics> statistics(const std::string& vehicle_id) const;
    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Run @p visitor on a consistent snapshot while commits are held off.
     *
     * Any commit not contained in the snapshot reaches listeners strictly
     * after @p visitor returns.
     */
    void visit_snapshot(const SnapshotVisitor& visitor) const;

    /** @brief Register a callback invoked, in commit order, for every apply. */
    ListenerId add_commit_listener(CommitListener listener);
    void remove_commit_listener(ListenerId listener_id);

    /**
     * @brief Drop vehicles whose latest report is older than @p cutoff_s.
     *
     * Entries with an apply in flight are skipped.
     * @return number of vehicles removed.
     */
    std::size_t reap_expired(EpochSeconds cutoff_s);

  private:
    struct VehicleEntry final {
        explicit VehicleEntry(std::size_t history_capacity) : window(history_capacity) {}

        std::mutex mutex;
        HistoryWindow window;
        std::shared_ptr<const VehicleStatus> status;  /**< Swapped only under commit_mutex_. */
        bool retired{false};                          /**< Set under mutex when reaped. */
    };

    struct Shard final {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<VehicleEntry>> map_entries;
    };

    [[nodiscard]] Shard& shard_for(const std::string& vehicle_id) const;
    [[nodiscard]] std::shared_ptr<VehicleEntry> find_entry(const std::string& vehicle_id) const;
    std::shared_ptr<VehicleEntry> find_or_create_entry(const std::string& vehicle_id);
    [[nodiscard]] std::vector<VehicleStatus> collect_statuses() const;
    void notify_listeners(const VehicleStatus& status);

    DetectorConfig detector_config_;
    StoreConfig store_config_;
    ClockFunction clock_;
    RuleSet rule_set_;
    std::vector<std::unique_ptr<Shard>> list_shards_;
    mutable std::shared_mutex commit_mutex_;
    std::uint64_t commit_sequence_{0};
    ListenerId next_listener_id_{1};
    std::vector<std::pair<ListenerId, CommitListener>> list_listeners_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ghost_bus
