/**
 * Request and response types exchanged with the sandbox service.
 * Field names on the wire are snake_case.
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace rock::runtime {

// How arun() executes a command
enum class RunMode {
    NORMAL,   // Synchronously inside a named session
    NOHUP     // Detached, completion tracked by the background supervisor
};

const char* run_mode_to_string(RunMode mode);
RunMode run_mode_from_string(const std::string& str);

// Failure reasons reported in detached-mode observations
constexpr const char* PID_EXTRACTION_FAILED = "PID extraction failed";
constexpr const char* PROCESS_NOT_COMPLETED = "Process did not complete successfully";

// Uniform result of synchronous and detached execution
struct Observation {
    std::string output;
    std::optional<int> exit_code;
    std::string failure_reason;
    std::string expect_string;

    bool succeeded() const { return exit_code && *exit_code == 0; }

    nlohmann::json to_json() const;
    static Observation from_json(const nlohmann::json& j);
};

// Stateless command for execute(). Either a shell string or an argv list.
struct Command {
    std::string command;
    std::vector<std::string> argv;       // Takes precedence when non-empty
    int timeout = 1200;                  // Seconds
    std::map<std::string, std::string> env;
    std::string cwd;

    static Command shell(std::string command, int timeout = 1200);
    static Command args(std::vector<std::string> argv, int timeout = 1200);

    // Human-readable form for logs
    std::string display() const;
};

struct CommandResponse {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;

    static CommandResponse from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct SandboxStatus {
    std::string sandbox_id;
    std::string host_name;
    std::string host_ip;
    bool is_alive = true;
    std::string image;
    std::optional<double> cpus;
    std::string memory;
    nlohmann::json status;               // Raw per-phase status reported by the service

    static SandboxStatus from_json(const nlohmann::json& j);
};

struct IsAliveResponse {
    bool is_alive = false;
    std::string message;
};

struct CreateSessionRequest {
    std::string session = "default";
    std::vector<std::string> startup_source;
    bool env_enable = false;
    std::map<std::string, std::string> env;
    std::string remote_user;

    nlohmann::json to_json() const;
};

struct CreateSessionResponse {
    std::string output;
    std::string session_type = "bash";
};

struct WriteFileResponse {
    bool success = false;
    std::string message;
};

struct ReadFileResponse {
    std::string content;
};

struct UploadResponse {
    bool success = false;
    std::string message;
    std::string file_name;
};

// Options for Sandbox::arun()
struct ArunOptions {
    std::optional<std::string> session;          // Default: "default" (NORMAL) or generated (NOHUP)
    RunMode mode = RunMode::NORMAL;
    int timeout = 300;                           // NORMAL: per-command timeout in seconds
    int wait_timeout = 300;                      // NOHUP: overall completion budget in seconds
    int wait_interval = 10;                      // NOHUP: requested poll interval in seconds
    std::optional<size_t> response_limited_bytes; // NOHUP: read at most this many output bytes
    bool ignore_output = false;                  // NOHUP: do not read the output file
    std::optional<std::string> output_file;      // NOHUP: default /tmp/tmp_<ms>.out
};

} // namespace rock::runtime
