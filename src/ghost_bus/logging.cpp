#include "ghost_bus/logging.hpp"

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ghost_bus {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;

constexpr const char* k_logger_name{"ghost_bus"};
constexpr const char* k_console_pattern{"[%l] %v"};
constexpr const char* k_file_pattern{R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":%v})"};

std::vector<spdlog::sink_ptr> make_sinks(const LoggingOptions& options) {
    const std::filesystem::path path_log_dir{options.log_directory};
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error("Unable to create log directory at " + path_log_dir.string() + ": " + error_directory.message());
    }

    std::vector<spdlog::sink_ptr> list_sinks;
    if (options.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(k_console_pattern);
        list_sinks.push_back(std::move(console_sink));
    }
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (path_log_dir / options.file_name).string(),
        options.max_file_size_bytes,
        options.max_files
    );
    // Timestamps are rendered in UTC to match the trailing 'Z'.
    file_sink->set_formatter(std::make_unique<spdlog::pattern_formatter>(k_file_pattern, spdlog::pattern_time_type::utc));
    list_sinks.push_back(std::move(file_sink));
    return list_sinks;
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const LoggingOptions& options) {
    std::call_once(logger_once_flag, [&options]() {
        const std::vector<spdlog::sink_ptr> list_sinks = make_sinks(options);
        auto logger = std::make_shared<spdlog::logger>(k_logger_name, list_sinks.begin(), list_sinks.end());
        logger->set_level(options.level);
        logger->flush_on(options.flush_level);
        spdlog::register_logger(logger);
        shared_logger = std::move(logger);
    });
    return shared_logger;
}

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    LoggingOptions options{};
    options.log_directory = log_directory;
    return initialize_logger(options);
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str_level) {
    // from_str maps every unknown name to "off", so "off" must be matched explicitly.
    const spdlog::level::level_enum level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        return std::nullopt;
    }
    return level;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    const std::optional<spdlog::level::level_enum> level = parse_log_level(str_level);
    if (!level.has_value()) {
        shared_logger->warn("{}", to_log_payload({{"component", "logging"}, {"event", "unknown_level"}, {"level", str_level}}));
        shared_logger->set_level(spdlog::level::info);
        return;
    }
    shared_logger->set_level(*level);
}

std::string to_log_payload(const nlohmann::json& event) {
    return event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace ghost_bus
