#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

#include <spdlog/spdlog.h>

#include "ghost_bus/bus_simulator.hpp"
#include "ghost_bus/configuration.hpp"
#include "ghost_bus/durable_store.hpp"
#include "ghost_bus/errors.hpp"
#include "ghost_bus/ghost_bus_service.hpp"
#include "ghost_bus/gtfs_reference_loader.hpp"
#include "ghost_bus/logging.hpp"
#include "ghost_bus/message_codec.hpp"

namespace {
std::atomic<bool> should_terminate{false};
constexpr std::chrono::seconds k_reap_interval{30};

void handle_signal(int) {
    should_terminate.store(true);
}

/** @brief Observer that writes every push message to the log. */
class LogObserverSink final : public ghost_bus::ObserverSink {
  public:
    LogObserverSink() : logger_(ghost_bus::get_logger()) {}

    void send(const ghost_bus::FanoutMessage& message) override {
        logger_->info(R"({{"component":"observer","message":{}}})", ghost_bus::encode_message(message));
    }

  private:
    std::shared_ptr<spdlog::logger> logger_;
};
}  // namespace

int main() {
    using namespace ghost_bus;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);

        auto durable_store = std::make_shared<InMemoryDurableStore>();
        GhostBusService service{configuration.service, durable_store};

        if (!configuration.gtfs_directory.empty()) {
            GtfsReferenceLoader reference{configuration.gtfs_directory};
            try {
                reference.load();
                service.prime_reference_cache(reference);
            } catch (const CollaboratorUnavailable& exc) {
                get_logger()->warn("GTFS reference data unavailable, continuing without it: {}", exc.what());
            }
        }

        const ConnectionId observer_id = service.attach(std::make_shared<LogObserverSink>());

        std::optional<BusSimulator> simulator;
        if (configuration.simulator_hz > 0.0) {
            simulator.emplace(service, configuration.simulator_hz);
            simulator->run();
        }

        auto next_reap = std::chrono::steady_clock::now() + k_reap_interval;
        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            if (std::chrono::steady_clock::now() >= next_reap) {
                service.reap_expired();
                next_reap += k_reap_interval;
            }
        }

        if (simulator.has_value()) {
            simulator->shutdown();
        }
        service.detach(observer_id);
        service.shutdown();
        get_logger()->info("ghost_bus_server stopped; vehicles tracked={}", service.vehicle_count());
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
