// === Fan-out Manager =========================================================
//
// Tracks observer connections and pushes vehicle statuses to them. A new
// observer first receives a snapshot of the store; afterwards every committed
// status is broadcast as a `bus_update`, in the store's global commit order.
//
// Each connection owns a bounded queue drained by its own delivery thread, so
// a slow or broken observer never stalls the broadcaster: overflowing the
// queue or failing a send detaches that connection only.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "ghost_bus/logging.hpp"
#include "ghost_bus/vehicle_state_store.hpp"
#include "ghost_bus/vehicle_status.hpp"

namespace ghost_bus {

/** @brief Kinds of message pushed to observers. */
enum class MessageType {
    Snapshot,   /**< Full store dump, first message on every connection. */
    BusUpdate   /**< One vehicle's freshly committed status. */
};

[[nodiscard]] std::string_view to_string(MessageType type) noexcept;

/** @brief Tagged push message; `statuses` holds exactly one entry for updates. */
struct FanoutMessage final {
    MessageType type{MessageType::BusUpdate};
    std::vector<VehicleStatus> statuses{};
};

using FanoutMessagePtr = std::shared_ptr<const FanoutMessage>;

[[nodiscard]] FanoutMessagePtr make_snapshot_message(std::vector<VehicleStatus> statuses);
[[nodiscard]] FanoutMessagePtr make_update_message(const VehicleStatus& status);

/**
 * @brief Transport-agnostic observer capability.
 *
 * `send` may block; it is only ever called from the connection's delivery
 * thread. Throwing any std::exception (typically DeliveryFailure) detaches
 * the connection.
 */
class ObserverSink {
  public:
    virtual ~ObserverSink() = default;

    virtual void send(const FanoutMessage& message) = 0;
    /** @brief Called once after the connection is detached. */
    virtual void close() noexcept {}
};

using ObserverSinkPtr = std::shared_ptr<ObserverSink>;
using ConnectionId = std::uint64_t;

/** @brief Connection lifecycle: Connecting -> Attached -> Detached. */
enum class ConnectionState {
    Connecting,
    Attached,
    Detached
};

/** @brief Tunables for observer delivery. */
struct FanoutConfig final {
    std::size_t queue_capacity{256};                           /**< Pending messages per observer. */
    std::chrono::milliseconds send_timeout{2000};              /**< Budget for snapshot delivery and for joining on shutdown. */
};

/**
 * @brief One observer: bounded FIFO plus a dedicated delivery thread.
 *
 * Must be owned by a shared_ptr; the delivery thread keeps the connection
 * alive, so a thread abandoned inside `send` can still finish on its own.
 */
class ObserverConnection final : public std::enable_shared_from_this<ObserverConnection> {
  public:
    using FailureCallback = std::function<void(ConnectionId, const std::string&)>;

    ObserverConnection(ConnectionId connection_id, ObserverSinkPtr sink, std::size_t queue_capacity, FailureCallback on_failure);
    ~ObserverConnection();

    ObserverConnection(const ObserverConnection&) = delete;
    ObserverConnection& operator=(const ObserverConnection&) = delete;

    [[nodiscard]] ConnectionId id() const noexcept;
    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] std::size_t delivered_count() const;
    /** @brief True once the delivery thread has returned. */
    [[nodiscard]] bool finished() const;

    /** @brief Spawn the delivery thread. */
    void start();
    void mark_attached();
    /** @brief Queue @p message; false when the queue is full or the connection detached. */
    [[nodiscard]] bool enqueue(FanoutMessagePtr message);
    /** @brief Block until @p count messages were sent, the connection died, or @p timeout passed. */
    [[nodiscard]] bool wait_for_delivered(std::size_t count, std::chrono::milliseconds timeout) const;
    /** @brief Transition to Detached and drop anything still queued. */
    void close();
    /** @brief True once the connection has been detached for at least @p grace. */
    [[nodiscard]] bool closed_for(std::chrono::milliseconds grace) const;
    /**
     * @brief Join the delivery thread if it finishes within @p timeout.
     *
     * A thread still inside `send` after that is detached; its failure
     * callback is dropped. Returns false in that case.
     */
    [[nodiscard]] bool join_for(std::chrono::milliseconds timeout);

  private:
    void delivery_loop();
    void report_failure(const std::string& reason);

    ConnectionId connection_id_;
    ObserverSinkPtr sink_;
    std::size_t queue_capacity_;
    std::mutex callback_mutex_;
    FailureCallback on_failure_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_pending_;
    mutable std::condition_variable cv_delivered_;
    std::deque<FanoutMessagePtr> deque_pending_;
    ConnectionState state_{ConnectionState::Connecting};
    std::size_t delivered_count_{0};
    bool flag_finished_{false};
    std::chrono::steady_clock::time_point closed_at_{};
    std::thread delivery_thread_;
};

using ObserverConnectionPtr = std::shared_ptr<ObserverConnection>;

/** @brief Registry of live observers wired to a VehicleStateStore. */
class FanoutManager final {
  public:
    FanoutManager(VehicleStateStore& store, FanoutConfig config);
    ~FanoutManager();

    FanoutManager(const FanoutManager&) = delete;
    FanoutManager& operator=(const FanoutManager&) = delete;

    /**
     * @brief Register @p sink and deliver the snapshot before returning.
     *
     * @throws DeliveryFailure if the snapshot could not be delivered within
     *         the send timeout; the connection is detached in that case.
     */
    ConnectionId attach(ObserverSinkPtr sink);
    /** @brief Detach @p connection_id; unknown ids are ignored. */
    void detach(ConnectionId connection_id);
    /** @brief Enqueue @p status for every attached observer. */
    void publish_update(const VehicleStatus& status);

    [[nodiscard]] std::size_t connection_count() const;
    [[nodiscard]] bool is_attached(ConnectionId connection_id) const;

    /**
     * @brief Detach everything and join all delivery threads.
     *
     * Waits at most `send_timeout` overall; threads stuck in `send` past that
     * are abandoned.
     */
    void shutdown();

  private:
    void retire_locked(ConnectionId connection_id, const std::string& reason);
    void handle_delivery_failure(ConnectionId connection_id, const std::string& reason);
    void join_finished_connections();
    void release_connection(const ObserverConnectionPtr& connection, std::chrono::milliseconds timeout);

    VehicleStateStore& store_;
    FanoutConfig config_;
    VehicleStateStore::ListenerId listener_id_;
    mutable std::mutex registry_mutex_;
    ConnectionId next_connection_id_{1};
    std::map<ConnectionId, ObserverConnectionPtr> map_connections_;
    std::vector<ObserverConnectionPtr> list_retired_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ghost_bus
