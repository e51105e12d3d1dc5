#include "runtime/process.hpp"
#include "runtime/sandbox.hpp"
#include "util/logger.hpp"

#include <fmt/core.h>

namespace rock::runtime {

Process::Process(Sandbox& sandbox)
    : sandbox_(sandbox)
    , logger_(util::get_logger("rock.sandbox.process")) {}

Observation Process::execute_script(const ExecuteScriptRequest& request) {
    const std::string& sandbox_id = sandbox_.sandbox_id();
    std::string name = request.script_name
        ? *request.script_name
        : fmt::format("script_{}.sh", sandbox_.clock().epoch_millis());
    std::string script_path = "/tmp/" + name;

    Observation result;
    try {
        logger_->info("[{}] Uploading script to {}", sandbox_id, script_path);
        WriteFileResponse written = sandbox_.write_file(script_path, request.script_content);
        if (!written.success) {
            result.output = fmt::format("Failed to upload script: {}", written.message);
            result.exit_code = 1;
            result.failure_reason = "Script upload failed";
            logger_->error("[{}] {}", sandbox_id, result.output);
        } else {
            logger_->info("[{}] Executing script: {} (timeout={}s)", sandbox_id, script_path, request.wait_timeout);
            ArunOptions options;
            options.mode = RunMode::NOHUP;
            options.wait_timeout = request.wait_timeout;
            options.wait_interval = request.wait_interval;
            result = sandbox_.arun(fmt::format("bash {}", script_path), options);
        }
    } catch (const std::exception& e) {
        result = Observation{};
        result.output = fmt::format("Script execution failed: {}", e.what());
        result.exit_code = 1;
        result.failure_reason = result.output;
        logger_->error("[{}] {}", sandbox_id, result.output);
    }

    if (request.cleanup) {
        try {
            logger_->info("[{}] Cleaning up script: {}", sandbox_id, script_path);
            sandbox_.execute(Command::args({"rm", "-f", script_path}, 30));
        } catch (const std::exception& e) {
            logger_->warn("[{}] Failed to cleanup script {}: {}", sandbox_id, script_path, e.what());
        }
    }

    return result;
}

} // namespace rock::runtime
