#include "util/logger.hpp"
#include "util/env.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace rock::util {

namespace {

std::mutex g_sinks_mutex;
std::vector<spdlog::sink_ptr> g_sinks;
spdlog::level::level_enum g_level = spdlog::level::info;
std::string g_pattern = LoggingConfig{}.pattern;

std::vector<spdlog::sink_ptr> current_sinks() {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    if (g_sinks.empty()) {
        g_sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    return g_sinks;
}

} // namespace

LoggingConfig LoggingConfig::from_env() {
    LoggingConfig config;
    config.level = EnvVars::logging_level();
    config.log_dir = EnvVars::logging_path();
    config.file_name = EnvVars::logging_file_name();
    return config;
}

spdlog::level::level_enum parse_log_level(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.log_dir.empty()) {
        std::string path = config.log_dir + "/" + config.file_name;
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path));
        } catch (const spdlog::spdlog_ex& e) {
            // Console logging still works, report and continue
            spdlog::warn("Cannot open log file {}: {}", path, e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(g_sinks_mutex);
        g_sinks = sinks;
        g_level = parse_log_level(config.level);
        g_pattern = config.pattern;
    }

    spdlog::drop_all();
    auto root = std::make_shared<spdlog::logger>("rock", sinks.begin(), sinks.end());
    spdlog::set_default_logger(root);
    spdlog::set_level(g_level);
    spdlog::set_pattern(g_pattern);
}

void shutdown_logging() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& l) { l->flush(); });
    spdlog::drop_all();

    {
        std::lock_guard<std::mutex> lock(g_sinks_mutex);
        g_sinks.clear();
    }

    // drop_all() also drops the default logger used by spdlog::info() and friends
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "rock", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto sinks = current_sinks();
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());

    spdlog::level::level_enum level;
    std::string pattern;
    {
        std::lock_guard<std::mutex> lock(g_sinks_mutex);
        level = g_level;
        pattern = g_pattern;
    }
    logger->set_level(level);
    logger->set_pattern(pattern);

    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // Lost a registration race with another thread, use the winner
        if (auto winner = spdlog::get(name)) {
            return winner;
        }
    }
    return logger;
}

void set_log_level(spdlog::level::level_enum level) {
    {
        std::lock_guard<std::mutex> lock(g_sinks_mutex);
        g_level = level;
    }
    spdlog::set_level(level);
}

} // namespace rock::util
