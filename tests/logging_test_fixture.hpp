#pragma once

#include "ghost_bus/logging.hpp"

#include <filesystem>
#include <memory>

namespace ghost_bus::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        ghost_bus::LoggingOptions options{};
        options.log_directory = (std::filesystem::temp_directory_path() / "ghost_bus_tests_logs").string();
        options.file_name = "ghost_bus_tests.log";
        options.console = false;
        options.level = spdlog::level::debug;
        return ghost_bus::initialize_logger(options);
    }();
    (void)logger_handle;
}

}  // namespace ghost_bus::test
