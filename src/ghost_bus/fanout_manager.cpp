#include "ghost_bus/fanout_manager.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "ghost_bus/errors.hpp"

namespace ghost_bus {

std::string_view to_string(MessageType type) noexcept {
    return type == MessageType::Snapshot ? "snapshot" : "bus_update";
}

FanoutMessagePtr make_snapshot_message(std::vector<VehicleStatus> statuses) {
    auto message = std::make_shared<FanoutMessage>();
    message->type = MessageType::Snapshot;
    message->statuses = std::move(statuses);
    return message;
}

FanoutMessagePtr make_update_message(const VehicleStatus& status) {
    auto message = std::make_shared<FanoutMessage>();
    message->type = MessageType::BusUpdate;
    message->statuses.push_back(status);
    return message;
}

// --- ObserverConnection ------------------------------------------------------

ObserverConnection::ObserverConnection(ConnectionId connection_id, ObserverSinkPtr sink, std::size_t queue_capacity, FailureCallback on_failure)
    : connection_id_(connection_id),
      sink_(std::move(sink)),
      queue_capacity_(queue_capacity),
      on_failure_(std::move(on_failure)) {
    if (sink_ == nullptr) {
        throw std::invalid_argument("ObserverConnection requires a sink");
    }
    if (queue_capacity_ == 0) {
        throw std::invalid_argument("ObserverConnection requires a positive queue capacity");
    }
}

ObserverConnection::~ObserverConnection() {
    close();
    if (!delivery_thread_.joinable()) {
        return;
    }
    // The delivery thread holds the last reference when it outlives its owner.
    if (delivery_thread_.get_id() == std::this_thread::get_id()) {
        delivery_thread_.detach();
    } else {
        delivery_thread_.join();
    }
}

ConnectionId ObserverConnection::id() const noexcept {
    return connection_id_;
}

ConnectionState ObserverConnection::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

std::size_t ObserverConnection::delivered_count() const {
    std::scoped_lock lock(mutex_);
    return delivered_count_;
}

bool ObserverConnection::finished() const {
    std::scoped_lock lock(mutex_);
    return flag_finished_;
}

void ObserverConnection::start() {
    if (delivery_thread_.joinable()) {
        return;
    }
    delivery_thread_ = std::thread([self = shared_from_this()]() {
        self->delivery_loop();
    });
}

void ObserverConnection::mark_attached() {
    std::scoped_lock lock(mutex_);
    if (state_ == ConnectionState::Connecting) {
        state_ = ConnectionState::Attached;
    }
}

bool ObserverConnection::enqueue(FanoutMessagePtr message) {
    {
        std::scoped_lock lock(mutex_);
        if (state_ == ConnectionState::Detached || deque_pending_.size() >= queue_capacity_) {
            return false;
        }
        deque_pending_.push_back(std::move(message));
    }
    cv_pending_.notify_one();
    return true;
}

bool ObserverConnection::wait_for_delivered(std::size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    cv_delivered_.wait_for(lock, timeout, [this, count]() {
        return delivered_count_ >= count || state_ == ConnectionState::Detached;
    });
    return delivered_count_ >= count;
}

void ObserverConnection::close() {
    {
        std::scoped_lock lock(mutex_);
        if (state_ == ConnectionState::Detached) {
            return;
        }
        state_ = ConnectionState::Detached;
        closed_at_ = std::chrono::steady_clock::now();
        deque_pending_.clear();
    }
    cv_pending_.notify_all();
    cv_delivered_.notify_all();
}

bool ObserverConnection::closed_for(std::chrono::milliseconds grace) const {
    std::scoped_lock lock(mutex_);
    return state_ == ConnectionState::Detached && std::chrono::steady_clock::now() - closed_at_ >= grace;
}

bool ObserverConnection::join_for(std::chrono::milliseconds timeout) {
    if (!delivery_thread_.joinable()) {
        return true;
    }
    bool finished = false;
    if (delivery_thread_.get_id() != std::this_thread::get_id()) {
        std::unique_lock lock(mutex_);
        finished = cv_delivered_.wait_for(lock, timeout, [this]() { return flag_finished_; });
    }
    if (finished) {
        delivery_thread_.join();
        return true;
    }
    {
        std::scoped_lock lock(callback_mutex_);
        on_failure_ = nullptr;
    }
    delivery_thread_.detach();
    return false;
}

void ObserverConnection::report_failure(const std::string& reason) {
    std::scoped_lock lock(callback_mutex_);
    if (on_failure_) {
        on_failure_(connection_id_, reason);
    }
}

void ObserverConnection::delivery_loop() {
    while (true) {
        FanoutMessagePtr message;
        {
            std::unique_lock lock(mutex_);
            cv_pending_.wait(lock, [this]() {
                return !deque_pending_.empty() || state_ == ConnectionState::Detached;
            });
            if (state_ == ConnectionState::Detached) {
                break;
            }
            message = std::move(deque_pending_.front());
            deque_pending_.pop_front();
        }

        try {
            sink_->send(*message);
        } catch (const std::exception& exc) {
            report_failure(exc.what());
            close();
            break;
        }

        {
            std::scoped_lock lock(mutex_);
            ++delivered_count_;
        }
        cv_delivered_.notify_all();
    }

    sink_->close();
    {
        std::scoped_lock lock(mutex_);
        flag_finished_ = true;
    }
    cv_delivered_.notify_all();
}

// --- FanoutManager -----------------------------------------------------------

FanoutManager::FanoutManager(VehicleStateStore& store, FanoutConfig config)
    : store_(store),
      config_(config),
      listener_id_(0),
      logger_(get_logger()) {
    if (config_.queue_capacity == 0) {
        throw std::invalid_argument("FanoutManager requires a positive queue capacity");
    }
    listener_id_ = store_.add_commit_listener([this](const VehicleStatus& status) {
        publish_update(status);
    });
}

FanoutManager::~FanoutManager() {
    store_.remove_commit_listener(listener_id_);
    shutdown();
}

ConnectionId FanoutManager::attach(ObserverSinkPtr sink) {
    if (sink == nullptr) {
        throw std::invalid_argument("FanoutManager::attach requires a sink");
    }
    join_finished_connections();

    ConnectionId connection_id = 0;
    {
        std::scoped_lock lock(registry_mutex_);
        connection_id = next_connection_id_++;
    }

    auto connection = std::make_shared<ObserverConnection>(
        connection_id,
        std::move(sink),
        config_.queue_capacity,
        [this](ConnectionId failed_id, const std::string& reason) {
            handle_delivery_failure(failed_id, reason);
        }
    );
    connection->start();

    std::size_t snapshot_size = 0;
    try {
        store_.visit_snapshot([&](const std::vector<VehicleStatus>& statuses) {
            snapshot_size = statuses.size();
            std::scoped_lock lock(registry_mutex_);
            if (!connection->enqueue(make_snapshot_message(statuses))) {
                throw DeliveryFailure(fmt::format("connection {} rejected its snapshot", connection_id));
            }
            map_connections_.emplace(connection_id, connection);
            connection->mark_attached();
        });
    } catch (const std::exception&) {
        connection->close();
        throw;
    }

    logger_->info("{}", to_log_payload({
        {"component", "fanout"},
        {"event", "attach"},
        {"connection", connection_id},
        {"snapshot_size", snapshot_size},
    }));

    if (!connection->wait_for_delivered(1, config_.send_timeout)) {
        {
            std::scoped_lock lock(registry_mutex_);
            retire_locked(connection_id, "snapshot not delivered");
        }
        throw DeliveryFailure(fmt::format("snapshot delivery to connection {} failed", connection_id));
    }
    return connection_id;
}

void FanoutManager::detach(ConnectionId connection_id) {
    std::scoped_lock lock(registry_mutex_);
    retire_locked(connection_id, "detached");
}

void FanoutManager::publish_update(const VehicleStatus& status) {
    const FanoutMessagePtr message = make_update_message(status);
    std::vector<ConnectionId> list_overflowed;

    std::scoped_lock lock(registry_mutex_);
    for (const auto& [connection_id, connection] : map_connections_) {
        if (!connection->enqueue(message)) {
            list_overflowed.push_back(connection_id);
        }
    }
    for (const ConnectionId connection_id : list_overflowed) {
        retire_locked(connection_id, "queue overflow");
    }
}

std::size_t FanoutManager::connection_count() const {
    std::scoped_lock lock(registry_mutex_);
    return map_connections_.size();
}

bool FanoutManager::is_attached(ConnectionId connection_id) const {
    std::scoped_lock lock(registry_mutex_);
    return map_connections_.count(connection_id) > 0;
}

void FanoutManager::shutdown() {
    std::vector<ObserverConnectionPtr> list_to_join;
    {
        std::scoped_lock lock(registry_mutex_);
        for (const auto& [connection_id, connection] : map_connections_) {
            connection->close();
            list_retired_.push_back(connection);
        }
        map_connections_.clear();
        list_to_join.swap(list_retired_);
    }
    const auto deadline = std::chrono::steady_clock::now() + config_.send_timeout;
    for (const ObserverConnectionPtr& connection : list_to_join) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        release_connection(connection, std::max(remaining, std::chrono::milliseconds{0}));
    }
}

void FanoutManager::retire_locked(ConnectionId connection_id, const std::string& reason) {
    const auto iterator_connection = map_connections_.find(connection_id);
    if (iterator_connection == map_connections_.end()) {
        return;
    }
    ObserverConnectionPtr connection = iterator_connection->second;
    map_connections_.erase(iterator_connection);
    connection->close();
    list_retired_.push_back(std::move(connection));
    logger_->info("{}", to_log_payload({
        {"component", "fanout"},
        {"event", "detach"},
        {"connection", connection_id},
        {"reason", reason},
        {"remaining", map_connections_.size()},
    }));
}

void FanoutManager::handle_delivery_failure(ConnectionId connection_id, const std::string& reason) {
    logger_->warn("{}", to_log_payload({
        {"component", "fanout"},
        {"event", "delivery_failure"},
        {"connection", connection_id},
        {"error", reason},
    }));
    std::scoped_lock lock(registry_mutex_);
    retire_locked(connection_id, "delivery failure");
}

void FanoutManager::join_finished_connections() {
    std::vector<ObserverConnectionPtr> list_finished;
    {
        std::scoped_lock lock(registry_mutex_);
        // Connections stuck in `send` longer than the send timeout are collected too.
        const auto partition = std::stable_partition(list_retired_.begin(), list_retired_.end(), [this](const ObserverConnectionPtr& connection) {
            return !connection->finished() && !connection->closed_for(config_.send_timeout);
        });
        list_finished.assign(std::make_move_iterator(partition), std::make_move_iterator(list_retired_.end()));
        list_retired_.erase(partition, list_retired_.end());
    }
    for (const ObserverConnectionPtr& connection : list_finished) {
        release_connection(connection, std::chrono::milliseconds{0});
    }
}

void FanoutManager::release_connection(const ObserverConnectionPtr& connection, std::chrono::milliseconds timeout) {
    if (!connection->join_for(timeout)) {
        logger_->warn("{}", to_log_payload({
            {"component", "fanout"},
            {"event", "abandon"},
            {"connection", connection->id()},
        }));
    }
}

}  // namespace ghost_bus
