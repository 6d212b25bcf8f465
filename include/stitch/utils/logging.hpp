#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace stitch::utils {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL,
    OFF
};

struct LogConfig {
    LogLevel level = LogLevel::INFO;
    std::string pattern;                   // Empty uses the default pattern
    std::string file;                      // Optional rotating log file
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 3;
};

// Install the "stitch" logger as the spdlog default. Safe to call more than once;
// later calls replace the sinks and level.
std::shared_ptr<spdlog::logger> init_logging(const LogConfig& config = {});

void set_log_level(LogLevel level);
LogLevel get_log_level();

const char* log_level_to_string(LogLevel level);

// Unknown names map to INFO
LogLevel string_to_log_level(const std::string& str);

}  // namespace stitch::utils
