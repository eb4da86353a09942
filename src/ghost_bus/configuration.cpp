// === Configuration Loader ====================================================
//
// Reads the GHOST_BUS_* environment variables into a Configuration. Every
// lookup goes through EnvReader, which names the offending variable when a
// value cannot be parsed or is out of bounds and then keeps the default.

#include "ghost_bus/configuration.hpp"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "ghost_bus/logging.hpp"

namespace ghost_bus {

namespace {
constexpr double k_default_simulator_hz{0.1};
constexpr std::string_view k_default_log_directory{"logs"};

/** @brief Lower bound applied to numeric variables. */
enum class Bound {
    Positive,     /**< Value must be > 0. */
    NonNegative   /**< Zero allowed, typically meaning "disabled". */
};

/** @brief Typed accessors over the process environment. */
class EnvReader final {
  public:
    explicit EnvReader(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

    [[nodiscard]] std::string text(const char* variable, std::string_view fallback) const {
        const char* raw_value = std::getenv(variable);
        if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
            return std::string{fallback};
        }
        return std::string{raw_value};
    }

    [[nodiscard]] double number(const char* variable, double fallback, Bound bound = Bound::Positive) const {
        const char* raw_value = std::getenv(variable);
        if (raw_value == nullptr) {
            return fallback;
        }
        try {
            const double parsed_value = std::stod(raw_value);
            const bool in_bounds = bound == Bound::Positive ? parsed_value > 0.0 : parsed_value >= 0.0;
            if (!in_bounds) {
                logger_->warn("{}={} is out of range; using {}", variable, raw_value, fallback);
                return fallback;
            }
            return parsed_value;
        } catch (const std::logic_error&) {
            logger_->warn("{}='{}' is not a number; using {}", variable, raw_value, fallback);
            return fallback;
        }
    }

    [[nodiscard]] std::size_t count(const char* variable, std::size_t fallback) const {
        const char* raw_value = std::getenv(variable);
        if (raw_value == nullptr) {
            return fallback;
        }
        try {
            const long long parsed_value = std::stoll(raw_value);
            if (parsed_value <= 0) {
                logger_->warn("{}={} must be positive; using {}", variable, raw_value, fallback);
                return fallback;
            }
            return static_cast<std::size_t>(parsed_value);
        } catch (const std::logic_error&) {
            logger_->warn("{}='{}' is not an integer; using {}", variable, raw_value, fallback);
            return fallback;
        }
    }

  private:
    std::shared_ptr<spdlog::logger> logger_;
};
}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    const char* raw_log_directory = std::getenv("GHOST_BUS_LOG_DIR");
    config.log_directory = raw_log_directory == nullptr || std::string_view{raw_log_directory}.empty()
        ? std::string{k_default_log_directory}
        : std::string{raw_log_directory};

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");
    const EnvReader env{logger};

    config.log_level = env.text("GHOST_BUS_LOG_LEVEL", "info");
    if (!parse_log_level(config.log_level).has_value()) {
        logger->warn("Unknown GHOST_BUS_LOG_LEVEL '{}'; using info", config.log_level);
        config.log_level = "info";
    }
    config.gtfs_directory = env.text("GHOST_BUS_GTFS_DIR", "");
    config.simulator_hz = env.number("GHOST_BUS_SIMULATOR_HZ", k_default_simulator_hz, Bound::NonNegative);

    DetectorConfig& detector = config.service.detector;
    detector.stale_threshold_s = env.number("GHOST_BUS_STALE_THRESHOLD_S", detector.stale_threshold_s);
    detector.stationary_threshold_s = env.number("GHOST_BUS_STATIONARY_THRESHOLD_S", detector.stationary_threshold_s);
    detector.stationary_distance_m = env.number("GHOST_BUS_STATIONARY_DISTANCE_M", detector.stationary_distance_m);
    detector.service_area = parse_geofence(std::getenv("GHOST_BUS_GEOFENCE"), detector.service_area);

    StoreConfig& store = config.service.store;
    store.history_capacity = env.count("GHOST_BUS_HISTORY_CAPACITY", store.history_capacity);

    FanoutConfig& fanout = config.service.fanout;
    fanout.queue_capacity = env.count("GHOST_BUS_OBSERVER_QUEUE", fanout.queue_capacity);
    fanout.send_timeout = std::chrono::milliseconds{
        env.count("GHOST_BUS_SEND_TIMEOUT_MS", static_cast<std::size_t>(fanout.send_timeout.count()))
    };

    config.service.retention = Duration{env.number("GHOST_BUS_RETENTION_S", 0.0, Bound::NonNegative)};

    logger->info(
        "Configuration loaded: history_capacity={} stale_threshold_s={} queue_capacity={} retention_s={} gtfs_dir={} simulator_hz={}",
        store.history_capacity,
        detector.stale_threshold_s,
        fanout.queue_capacity,
        config.service.retention.count(),
        config.gtfs_directory.empty() ? "<none>" : config.gtfs_directory,
        config.simulator_hz
    );

    return config;
}

GeoBoundingBox ConfigurationLoader::parse_geofence(const char* raw_value, const GeoBoundingBox& fallback) {
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return fallback;
    }
    std::vector<double> values;
    std::stringstream stream{std::string{raw_value}};
    std::string token;
    try {
        while (std::getline(stream, token, ',')) {
            values.push_back(std::stod(token));
        }
    } catch (const std::logic_error&) {
        values.clear();
    }

    if (values.size() != 4 || values[0] >= values[1] || values[2] >= values[3]) {
        get_logger()->warn("Invalid GHOST_BUS_GEOFENCE '{}'; keeping default service area", raw_value);
        return fallback;
    }
    return GeoBoundingBox{values[0], values[1], values[2], values[3]};
}

}  // namespace ghost_bus
