#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include "common/errors.hpp"
#include "runtime/sandbox.hpp"
#include "runtime/run_helpers.hpp"
#include "util/env.hpp"
#include "util/logger.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

// ANSI escape codes
namespace term {
    constexpr const char* RESET     = "\033[0m";
    constexpr const char* BOLD      = "\033[1m";
    constexpr const char* DIM       = "\033[2m";
    constexpr const char* CYAN      = "\033[36m";
    constexpr const char* GREEN     = "\033[32m";
    constexpr const char* RED       = "\033[31m";
    constexpr const char* YELLOW    = "\033[33m";
}

struct CliOptions {
    rock::runtime::SandboxConfig sandbox;
    rock::runtime::ArunOptions arun;
    std::string log_level;
    bool retry = false;
    std::string command;
};

void print_usage(const char* prog) {
    std::cout << term::BOLD << "Usage: " << term::RESET << prog << " [options] -- <command...>\n\n"
              << "Start a sandbox, run one command in it and stop it again.\n\n"
              << term::BOLD << "Options:\n" << term::RESET
              << "  --base-url URL          Admin service (default: $ROCK_BASE_URL)\n"
              << "  --image IMAGE           Sandbox image (default: python:3.11)\n"
              << "  --memory SIZE           Memory limit (default: 8g)\n"
              << "  --cpus N                CPU limit (default: 2)\n"
              << "  --cluster NAME          Target cluster (default: zb)\n"
              << "  --startup-timeout SECS  Wait for the sandbox to be alive\n"
              << "  --session NAME          Run inside this session\n"
              << "  --timeout SECS          Per-command timeout (normal mode)\n"
              << "  --nohup                 Run detached and wait for completion\n"
              << "  --wait-timeout SECS     Detached completion budget (default: 300)\n"
              << "  --wait-interval SECS    Detached poll interval (min 5, default: 10)\n"
              << "  --limit-bytes N         Read at most N bytes of detached output\n"
              << "  --ignore-output         Do not read detached output\n"
              << "  --retry                 Retry the command while it exits nonzero\n"
              << "  --log-level LEVEL       DEBUG, INFO, WARN, ERROR\n"
              << "  -h, --help              Show this help\n";
}

// Returns false when the process should exit with the given code
bool parse_args(int argc, char** argv, CliOptions& opts, int& exit_code) {
    auto need_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw rock::InvalidParameterError(fmt::format("{} requires a value", flag));
        }
        return argv[++i];
    };

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            exit_code = 0;
            return false;
        } else if (arg == "--base-url") {
            opts.sandbox.base_url = need_value(i, arg);
        } else if (arg == "--image") {
            opts.sandbox.image = need_value(i, arg);
        } else if (arg == "--memory") {
            opts.sandbox.memory = need_value(i, arg);
        } else if (arg == "--cpus") {
            opts.sandbox.cpus = std::stod(need_value(i, arg));
        } else if (arg == "--cluster") {
            opts.sandbox.cluster = need_value(i, arg);
        } else if (arg == "--startup-timeout") {
            opts.sandbox.startup_timeout = std::stoi(need_value(i, arg));
        } else if (arg == "--session") {
            opts.arun.session = need_value(i, arg);
        } else if (arg == "--timeout") {
            opts.arun.timeout = std::stoi(need_value(i, arg));
        } else if (arg == "--nohup") {
            opts.arun.mode = rock::runtime::RunMode::NOHUP;
        } else if (arg == "--wait-timeout") {
            opts.arun.wait_timeout = std::stoi(need_value(i, arg));
        } else if (arg == "--wait-interval") {
            opts.arun.wait_interval = std::stoi(need_value(i, arg));
        } else if (arg == "--limit-bytes") {
            opts.arun.response_limited_bytes = std::stoul(need_value(i, arg));
        } else if (arg == "--ignore-output") {
            opts.arun.ignore_output = true;
        } else if (arg == "--retry") {
            opts.retry = true;
        } else if (arg == "--log-level") {
            opts.log_level = need_value(i, arg);
        } else {
            break;
        }
    }

    for (; i < argc; ++i) {
        if (!opts.command.empty()) opts.command += ' ';
        opts.command += argv[i];
    }

    if (opts.command.empty()) {
        std::cerr << term::RED << "error: " << term::RESET << "no command given\n\n";
        print_usage(argv[0]);
        exit_code = 2;
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    rock::util::load_dotenv();

    CliOptions opts;
    opts.sandbox = rock::runtime::SandboxConfig::from_env();

    int exit_code = 0;
    try {
        if (!parse_args(argc, argv, opts, exit_code)) {
            return exit_code;
        }
    } catch (const std::exception& e) {
        std::cerr << term::RED << "error: " << term::RESET << e.what() << "\n";
        return 2;
    }

    auto log_config = rock::util::LoggingConfig::from_env();
    if (!opts.log_level.empty()) {
        log_config.level = opts.log_level;
    }
    rock::util::init_logging(log_config);
    auto logger = rock::util::get_logger("rockctl");

    rock::runtime::Sandbox sandbox(opts.sandbox);
    try {
        std::cerr << term::CYAN << "⟳" << term::RESET << "  Starting sandbox ("
                  << opts.sandbox.image << ")...\n";
        rock::runtime::with_time_logging(logger, sandbox.clock(), "-", "start sandbox",
            [&] { sandbox.start(); });
        std::cerr << term::GREEN << "✓" << term::RESET << "  " << sandbox.sandbox_id()
                  << term::DIM << " on " << sandbox.host_name() << term::RESET << "\n";

        rock::runtime::Observation obs = opts.retry
            ? rock::runtime::arun_with_retry(sandbox, opts.command, opts.arun)
            : sandbox.arun(opts.command, opts.arun);

        std::cout << obs.output;
        if (!obs.output.empty() && obs.output.back() != '\n') {
            std::cout << "\n";
        }
        if (!obs.failure_reason.empty()) {
            std::cerr << term::YELLOW << "!" << term::RESET << "  " << obs.failure_reason << "\n";
        }
        exit_code = obs.exit_code ? *obs.exit_code : 1;
    } catch (const rock::RockError& e) {
        std::cerr << term::BOLD << term::RED << "✗" << term::RESET << "  " << e.what() << "\n";
        exit_code = 1;
    } catch (const std::exception& e) {
        logger->error("Unexpected failure: {}", e.what());
        std::cerr << term::BOLD << term::RED << "✗" << term::RESET << "  " << e.what() << "\n";
        exit_code = 1;
    }

    sandbox.close();
    rock::util::shutdown_logging();
    return exit_code;
}
