// === Logging =================================================================
//
// Process-wide spdlog logger shared by every component. Components capture the
// handle at construction; structured events are logged as JSON payloads so the
// rotating file stays one JSON object per line.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>
#include <spdlog/logger.h>

namespace ghost_bus {

/** @brief Sink layout for the shared logger. */
struct LoggingOptions final {
    std::string log_directory{"logs"};                         /**< Created if missing. */
    std::string file_name{"ghost_bus.log"};                    /**< Rotating JSON-lines file. */
    std::size_t max_file_size_bytes{10 * 1024 * 1024};
    std::size_t max_files{5};
    bool console{true};                                        /**< Mirror to coloured stdout. */
    spdlog::level::level_enum level{spdlog::level::info};
    spdlog::level::level_enum flush_level{spdlog::level::warn}; /**< Flush eagerly at or above. */
};

/**
 * @brief Create the shared logger once.
 *
 * Later calls return the existing logger and ignore @p options.
 * @throws std::runtime_error if the log directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const LoggingOptions& options);

/** @brief Default layout rooted at @p log_directory. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error if initialize_logger has not run yet. */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief spdlog level for @p str_level, or nullopt for unknown names. */
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str_level);

/** @brief Apply @p str_level; unknown names warn and fall back to info. */
void set_log_level(const std::string& str_level);

/**
 * @brief Render a structured event as one JSON object.
 *
 * Strings are escaped; invalid UTF-8 is replaced rather than thrown.
 */
[[nodiscard]] std::string to_log_payload(const nlohmann::json& event);

}  // namespace ghost_bus
