#include "runtime/background.hpp"
#include "runtime/sandbox.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <regex>

namespace rock::runtime {

std::optional<int64_t> extract_nohup_pid(const std::string& output) {
    static const std::regex pattern(
        std::string(PID_START_MARKER) + "(\\d+)" + PID_END_MARKER);

    std::smatch match;
    if (!std::regex_search(output, match, pattern)) {
        return std::nullopt;
    }
    try {
        return std::stoll(match[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string build_nohup_command(const std::string& cmd, const std::string& output_file) {
    return fmt::format("nohup {} < /dev/null > {} 2>&1 & echo {}$!{};disown",
        cmd, output_file, PID_START_MARKER, PID_END_MARKER);
}

BackgroundProcessSupervisor::BackgroundProcessSupervisor(Sandbox& sandbox,
                                                         std::shared_ptr<spdlog::logger> logger)
    : sandbox_(sandbox)
    , logger_(logger ? std::move(logger) : sandbox.logger()) {}

Observation BackgroundProcessSupervisor::run(const std::string& cmd, const ArunOptions& options) {
    const int64_t timestamp = sandbox_.clock().epoch_millis();
    const std::string& sandbox_id = sandbox_.sandbox_id();

    std::string session;
    if (options.session) {
        session = *options.session;
    } else {
        session = fmt::format("bash-{}", timestamp);
        CreateSessionRequest request;
        request.session = session;
        sandbox_.create_session(request);
    }

    std::string output_file = options.output_file
        ? *options.output_file
        : fmt::format("/tmp/tmp_{}.out", timestamp);

    // Launch
    Observation launch = sandbox_.run_in_session(
        build_nohup_command(cmd, output_file), session, LAUNCH_TIMEOUT_SECONDS);
    if (!launch.succeeded()) {
        logger_->warn("[{}] nohup launch failed (exit={}): {}", sandbox_id,
            launch.exit_code ? std::to_string(*launch.exit_code) : "none", launch.output);
        return launch;
    }

    auto pid = extract_nohup_pid(launch.output);
    if (!pid) {
        logger_->error("[{}] no PID in nohup output: {}", sandbox_id, launch.output);
        Observation obs;
        obs.output = "Failed to submit command, nohup failed to extract PID";
        obs.exit_code = 1;
        obs.failure_reason = PID_EXTRACTION_FAILED;
        return obs;
    }

    BackgroundTask task;
    task.pid = *pid;
    task.output_file = output_file;
    task.session = session;
    task.wait_timeout = std::chrono::seconds(options.wait_timeout);
    task.check_interval = std::chrono::seconds(
        std::max(MIN_CHECK_INTERVAL_SECONDS, options.wait_interval));

    logger_->info("[{}] nohup pid {} started in session {}, output {}",
        sandbox_id, task.pid, session, output_file);

    bool completed = wait_for_completion(task);

    Observation result;
    result.exit_code = completed ? 0 : 1;
    if (!completed) {
        result.failure_reason = fmt::format("{}: not finished within {}s",
            PROCESS_NOT_COMPLETED, options.wait_timeout);
    }

    if (options.ignore_output) {
        result.output = fmt::format(
            "Command executed in nohup mode without reading its output. Output file: {}",
            output_file);
        return result;
    }

    // A limit of 0 reads the whole file
    std::string read_cmd = options.response_limited_bytes && *options.response_limited_bytes > 0
        ? fmt::format("head -c {} {}", *options.response_limited_bytes, output_file)
        : fmt::format("cat {}", output_file);
    Observation read = sandbox_.run_in_session(read_cmd, session);
    result.output = read.output;
    return result;
}

bool BackgroundProcessSupervisor::wait_for_completion(const BackgroundTask& task) {
    util::Clock& clock = sandbox_.clock();
    const std::string& sandbox_id = sandbox_.sandbox_id();
    const auto start = clock.now();
    const std::string probe = fmt::format("kill -0 {}", task.pid);

    while (true) {
        auto elapsed = clock.elapsed_since(start);
        if (elapsed >= task.wait_timeout) {
            break;
        }

        auto remaining = task.wait_timeout - elapsed;
        auto probe_timeout = std::min(task.check_interval * 2, remaining);
        try {
            Observation obs = sandbox_.run_in_session(
                probe, task.session, probe_timeout.count() / 1000.0);
            if (obs.exit_code && *obs.exit_code != 0) {
                logger_->info("[{}] process {} finished after {}ms",
                    sandbox_id, task.pid, clock.elapsed_since(start).count());
                return true;
            }
        } catch (const std::exception& e) {
            // kill -0 fails once the process is gone
            logger_->info("[{}] process {} probe failed, treating as finished: {}",
                sandbox_id, task.pid, e.what());
            return true;
        }

        clock.sleep_for(task.check_interval);
    }

    logger_->warn("[{}] process {} still running after {}ms",
        sandbox_id, task.pid, task.wait_timeout.count());
    return false;
}

} // namespace rock::runtime
