/**
 * rock logging
 *
 * Thin layer over the spdlog registry. The registry is initialized once by
 * init_logging() and torn down by shutdown_logging(); components get their
 * named logger from get_logger() and hold on to it.
 */
#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace rock::util {

struct LoggingConfig {
    std::string level = "INFO";          // DEBUG, INFO, WARN, ERROR
    std::string log_dir;                 // Empty = console only
    std::string file_name = "rocklet.log";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // Build from ROCK_LOGGING_* environment variables
    static LoggingConfig from_env();
};

// Configure sinks and level for every logger created afterwards
void init_logging(const LoggingConfig& config = LoggingConfig{});

// Flush and drop all registered loggers
void shutdown_logging();

// Get or create a named logger sharing the configured sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

// Parse "DEBUG"/"info"/"warning"/... into an spdlog level (INFO on unknown)
spdlog::level::level_enum parse_log_level(const std::string& level);

void set_log_level(spdlog::level::level_enum level);

} // namespace rock::util
