/**
 * Detached command supervision
 *
 * A detached command is launched under nohup inside a session with its
 * output redirected to a file. The launch wrapper echoes the background PID
 * between two sentinel markers; the supervisor extracts it, probes the
 * process with `kill -0` until it is gone or the wait budget runs out, and
 * then reads the output file.
 *
 * Launch failure, missing PID and completion timeout are reported in the
 * returned Observation, never thrown.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "runtime/types.hpp"

namespace rock::runtime {

class Sandbox;

constexpr const char* PID_START_MARKER = "__ROCK_PID_START__";
constexpr const char* PID_END_MARKER = "__ROCK_PID_END__";

// Smallest allowed interval between liveness probes, in seconds
constexpr int MIN_CHECK_INTERVAL_SECONDS = 5;

// Timeout for the launch call itself, in seconds
constexpr int LAUNCH_TIMEOUT_SECONDS = 30;

// First PID found between the sentinel markers, if any
std::optional<int64_t> extract_nohup_pid(const std::string& output);

// nohup <cmd> < /dev/null > <file> 2>&1 & echo <markers around $!>;disown
std::string build_nohup_command(const std::string& cmd, const std::string& output_file);

// One detached invocation, alive for the duration of a single arun() call
struct BackgroundTask {
    int64_t pid = 0;
    std::string output_file;
    std::string session;
    std::chrono::milliseconds wait_timeout{0};
    std::chrono::milliseconds check_interval{0};
};

class BackgroundProcessSupervisor {
public:
    BackgroundProcessSupervisor(Sandbox& sandbox, std::shared_ptr<spdlog::logger> logger);

    // Launch, wait and collect. Session and output file default to
    // bash-<ms> (created here) and /tmp/tmp_<ms>.out.
    Observation run(const std::string& cmd, const ArunOptions& options);

    // Probe until the process is gone (true) or wait_timeout elapses (false)
    bool wait_for_completion(const BackgroundTask& task);

private:
    Sandbox& sandbox_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace rock::runtime
