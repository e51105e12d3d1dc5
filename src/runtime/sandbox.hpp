/**
 * rock Sandbox
 *
 * Client-side handle for one remote sandbox. Owns the lifecycle
 * (start/stop), named shell sessions, synchronous command execution and
 * file transfer. Detached commands are handed to the
 * BackgroundProcessSupervisor (see background.hpp).
 *
 * All calls block the calling thread; every remote call is bounded by a
 * transport timeout and every wait goes through the injected Clock.
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "runtime/config.hpp"
#include "runtime/types.hpp"
#include "transport/http_transport.hpp"
#include "util/clock.hpp"

namespace rock::runtime {

// Sandbox lifecycle state
enum class SandboxState {
    UNINITIALIZED,
    STARTING,
    ALIVE,
    STOPPED
};

const char* sandbox_state_to_string(SandboxState state);

class Process;
class FileSystem;
class Network;
class RemoteUser;

class Sandbox {
public:
    // Uses a CurlTransport, the steady clock and the "rock.sandbox" logger
    explicit Sandbox(const SandboxConfig& config);
    Sandbox(const SandboxConfig& config,
            std::shared_ptr<transport::HttpTransport> transport,
            std::shared_ptr<util::Clock> clock,
            std::shared_ptr<spdlog::logger> logger);
    ~Sandbox();

    // Non-copyable
    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Lifecycle. start() throws on failure and leaves the sandbox STOPPED;
    // stop() never throws.
    void start();
    void stop();
    void close() { stop(); }

    // Identity, set once start() succeeds
    SandboxState state() const { return state_; }
    bool is_started() const { return !sandbox_id_.empty(); }
    const std::string& sandbox_id() const;   // Throws NotStartedError before start
    const std::string& host_name() const { return host_name_; }
    const std::string& host_ip() const { return host_ip_; }
    const std::string& cluster() const { return config_.cluster; }
    const std::string& route_key() const { return route_key_; }
    const std::string& url() const { return url_; }
    const SandboxConfig& config() const { return config_; }

    // Remote status
    SandboxStatus get_status();
    IsAliveResponse is_alive();

    // Single-shot command outside any session, no retry
    CommandResponse execute(const Command& command);

    // Sessions
    CreateSessionResponse create_session(const CreateSessionRequest& request);
    void close_session(const std::string& session);

    // Run one command inside an existing session
    Observation run_in_session(const std::string& command,
                               const std::string& session,
                               std::optional<double> timeout_seconds = std::nullopt);

    // Unified entry point: NORMAL runs in a session, NOHUP runs detached
    Observation arun(const std::string& cmd, const ArunOptions& options = ArunOptions{});

    // Files
    WriteFileResponse write_file(const std::string& path, const std::string& content);
    ReadFileResponse read_file(const std::string& path,
                               const std::string& encoding = "",
                               const std::string& errors = "");
    UploadResponse upload(const std::string& source_path, const std::string& target_path);

    // Sub-capabilities
    Process& process() { return *process_; }
    FileSystem& fs() { return *fs_; }
    Network& network() { return *network_; }
    RemoteUser& remote_user() { return *remote_user_; }

    util::Clock& clock() { return *clock_; }
    const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }

    std::string to_string() const;

private:
    SandboxConfig config_;
    std::string url_;
    std::string route_key_;
    SandboxState state_ = SandboxState::UNINITIALIZED;

    std::string sandbox_id_;
    std::string host_name_;
    std::string host_ip_;

    std::shared_ptr<transport::HttpTransport> transport_;
    std::shared_ptr<util::Clock> clock_;
    std::shared_ptr<spdlog::logger> logger_;

    std::unique_ptr<Process> process_;
    std::unique_ptr<FileSystem> fs_;
    std::unique_ptr<Network> network_;
    std::unique_ptr<RemoteUser> remote_user_;

    transport::Headers build_headers() const;

    // POST to an endpoint and unwrap the {status, result} envelope
    nlohmann::json call(const std::string& operation, const std::string& endpoint,
                        const nlohmann::json& body, std::chrono::milliseconds timeout);

    // Throws RemoteCallError (or a code-specific subclass) on non-success
    static nlohmann::json unwrap(const std::string& operation, const std::string& url,
                                 const nlohmann::json& response);

    SandboxStatus fetch_status(const std::string& sandbox_id, std::chrono::milliseconds timeout);
    void wait_until_alive(const std::string& sandbox_id);
    void ensure_session(const std::string& session);
    void require_started(const char* operation) const;
    void set_state(SandboxState new_state);
};

} // namespace rock::runtime
