#include "runtime/sandbox.hpp"
#include "runtime/background.hpp"
#include "runtime/file_system.hpp"
#include "runtime/network.hpp"
#include "runtime/process.hpp"
#include "runtime/remote_user.hpp"
#include "common/errors.hpp"
#include "transport/curl_transport.hpp"
#include "util/logger.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace rock::runtime {

namespace {

constexpr const char* API_PATH = "/apis/envs/sandbox/v1";

// Default bound for calls that carry no timeout of their own
constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{300000};

// start(): settle delay before the first status check, per-check bound,
// and pause between checks
constexpr std::chrono::milliseconds START_SETTLE_DELAY{2000};
constexpr std::chrono::milliseconds STATUS_CHECK_TIMEOUT{10000};
constexpr std::chrono::milliseconds STATUS_CHECK_INTERVAL{3000};

std::string random_route_key() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 15);
    static const char* HEX = "0123456789abcdef";
    std::string key(32, '0');
    for (auto& c : key) {
        c = HEX[dist(gen)];
    }
    return key;
}

std::string json_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

const char* sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::UNINITIALIZED: return "UNINITIALIZED";
        case SandboxState::STARTING:      return "STARTING";
        case SandboxState::ALIVE:         return "ALIVE";
        case SandboxState::STOPPED:       return "STOPPED";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Sandbox Implementation
// ============================================================================

Sandbox::Sandbox(const SandboxConfig& config)
    : Sandbox(config,
              std::make_shared<transport::CurlTransport>(util::get_logger("rock.transport")),
              util::default_clock(),
              util::get_logger("rock.sandbox")) {}

Sandbox::Sandbox(const SandboxConfig& config,
                 std::shared_ptr<transport::HttpTransport> transport,
                 std::shared_ptr<util::Clock> clock,
                 std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , url_(config.base_url + API_PATH)
    , route_key_(config.route_key ? *config.route_key : random_route_key())
    , transport_(std::move(transport))
    , clock_(std::move(clock))
    , logger_(std::move(logger)) {
    if (!transport_) {
        throw InvalidParameterError("Sandbox requires a transport");
    }
    if (!clock_) {
        clock_ = util::default_clock();
    }
    if (!logger_) {
        logger_ = util::get_logger("rock.sandbox");
    }

    process_ = std::make_unique<Process>(*this);
    fs_ = std::make_unique<FileSystem>(*this);
    network_ = std::make_unique<Network>(*this);
    remote_user_ = std::make_unique<RemoteUser>(*this);
}

Sandbox::~Sandbox() {
    if (state_ == SandboxState::ALIVE) {
        logger_->debug("Sandbox {} released while alive, remote auto clear applies", sandbox_id_);
    }
}

const std::string& Sandbox::sandbox_id() const {
    if (sandbox_id_.empty()) {
        throw NotStartedError("get sandbox id");
    }
    return sandbox_id_;
}

void Sandbox::set_state(SandboxState new_state) {
    logger_->debug("Sandbox {} state: {} -> {}",
        sandbox_id_.empty() ? "<unstarted>" : sandbox_id_,
        sandbox_state_to_string(state_),
        sandbox_state_to_string(new_state));
    state_ = new_state;
}

void Sandbox::require_started(const char* operation) const {
    if (sandbox_id_.empty() || state_ != SandboxState::ALIVE) {
        throw NotStartedError(operation);
    }
}

transport::Headers Sandbox::build_headers() const {
    transport::Headers headers;
    headers["ROUTE-KEY"] = route_key_;
    headers["X-Cluster"] = config_.cluster;
    for (const auto& [key, value] : config_.extra_headers) {
        headers[key] = value;
    }
    if (!config_.user_id.empty()) {
        headers["X-User-Id"] = config_.user_id;
    }
    if (!config_.experiment_id.empty()) {
        headers["X-Experiment-Id"] = config_.experiment_id;
    }
    if (!config_.namespace_name.empty()) {
        headers["X-Namespace"] = config_.namespace_name;
    }
    return headers;
}

json Sandbox::unwrap(const std::string& operation, const std::string& url,
                     const json& response) {
    if (response.is_object() && json_string(response, "status") == "Success") {
        auto it = response.find("result");
        if (it == response.end() || it->is_null()) {
            return json::object();
        }
        return *it;
    }

    int code = 0;
    if (response.is_object()) {
        auto result = response.find("result");
        if (result != response.end() && result->is_object()) {
            auto c = result->find("code");
            if (c != result->end() && c->is_number_integer()) {
                code = c->get<int>();
            }
        }
    }

    std::string detail = response.dump();
    raise_for_code(code, operation, url, detail);
    throw RemoteCallError(operation, url, detail, code);
}

json Sandbox::call(const std::string& operation, const std::string& endpoint,
                   const json& body, std::chrono::milliseconds timeout) {
    std::string url = url_ + "/" + endpoint;
    logger_->debug("POST {} ({})", url, operation);
    return unwrap(operation, url, transport_->post_json(url, build_headers(), body, timeout));
}

// ============================================================================
// Lifecycle
// ============================================================================

void Sandbox::start() {
    if (state_ == SandboxState::ALIVE) {
        logger_->warn("Sandbox {} already alive", sandbox_id_);
        return;
    }

    config_.validate();
    set_state(SandboxState::STARTING);

    json data;
    data["image"] = config_.image;
    data["auto_clear_time"] = config_.auto_clear_seconds / 60;
    data["auto_clear_time_minutes"] = config_.auto_clear_seconds / 60;
    data["startup_timeout"] = config_.startup_timeout;
    data["memory"] = config_.memory;
    data["cpus"] = config_.cpus;

    logger_->info("Starting sandbox (image={}, memory={}, cpus={})",
        config_.image, config_.memory, config_.cpus);

    std::string pending_id;
    std::string pending_host_name;
    std::string pending_host_ip;
    try {
        json result = call("start sandbox", "start_async", data, DEFAULT_REQUEST_TIMEOUT);
        pending_id = json_string(result, "sandbox_id");
        pending_host_name = json_string(result, "host_name");
        pending_host_ip = json_string(result, "host_ip");
        if (pending_id.empty()) {
            throw RemoteCallError("start sandbox", url_ + "/start_async",
                                  "response carries no sandbox_id");
        }

        logger_->info("Sandbox {} scheduled on {}, waiting until alive", pending_id, pending_host_name);
        wait_until_alive(pending_id);
    } catch (const std::exception& e) {
        if (pending_id.empty()) {
            logger_->error("Failed to start sandbox: {}", e.what());
        } else {
            logger_->warn("Sandbox {} was scheduled but not started, releasing handle "
                          "(reclaim it or wait for auto clear): {}", pending_id, e.what());
        }
        sandbox_id_.clear();
        host_name_.clear();
        host_ip_.clear();
        set_state(SandboxState::STOPPED);
        throw;
    }

    sandbox_id_ = pending_id;
    if (host_name_.empty()) host_name_ = pending_host_name;
    if (host_ip_.empty()) host_ip_ = pending_host_ip;
    set_state(SandboxState::ALIVE);
    logger_->info("Sandbox {} is alive (host={}, ip={})", sandbox_id_, host_name_, host_ip_);
}

void Sandbox::wait_until_alive(const std::string& sandbox_id) {
    clock_->sleep_for(START_SETTLE_DELAY);

    const auto budget = std::chrono::milliseconds(std::chrono::seconds(config_.startup_timeout));
    const auto start = clock_->now();

    while (true) {
        auto elapsed = clock_->elapsed_since(start);
        if (elapsed >= budget) {
            break;
        }

        auto check_timeout = std::min(STATUS_CHECK_TIMEOUT, budget - elapsed);
        try {
            SandboxStatus status = fetch_status(sandbox_id, check_timeout);
            if (status.is_alive) {
                host_name_ = status.host_name;
                host_ip_ = status.host_ip;
                return;
            }
        } catch (const std::exception& e) {
            logger_->debug("Status check for {} failed, retrying: {}", sandbox_id, e.what());
        }

        clock_->sleep_for(STATUS_CHECK_INTERVAL);
    }

    throw StartTimeoutError(sandbox_id, config_.startup_timeout);
}

void Sandbox::stop() {
    if (sandbox_id_.empty() || state_ == SandboxState::STOPPED) {
        return;
    }

    logger_->info("Stopping sandbox {}", sandbox_id_);
    try {
        json data;
        data["sandbox_id"] = sandbox_id_;
        call("stop sandbox", "stop", data, DEFAULT_REQUEST_TIMEOUT);
    } catch (const std::exception& e) {
        logger_->warn("Failed to stop sandbox {}, IGNORE: {}", sandbox_id_, e.what());
    }
    set_state(SandboxState::STOPPED);
}

// ============================================================================
// Status
// ============================================================================

SandboxStatus Sandbox::fetch_status(const std::string& sandbox_id, std::chrono::milliseconds timeout) {
    std::string url = url_ + "/get_status?sandbox_id=" + sandbox_id;
    json result = unwrap("get status", url, transport_->get_json(url, build_headers(), timeout));
    return SandboxStatus::from_json(result);
}

SandboxStatus Sandbox::get_status() {
    if (sandbox_id_.empty()) {
        throw NotStartedError("get status");
    }
    return fetch_status(sandbox_id_, DEFAULT_REQUEST_TIMEOUT);
}

IsAliveResponse Sandbox::is_alive() {
    SandboxStatus status = get_status();
    IsAliveResponse resp;
    resp.is_alive = status.is_alive;
    resp.message = status.host_name;
    return resp;
}

// ============================================================================
// Execution
// ============================================================================

CommandResponse Sandbox::execute(const Command& command) {
    require_started("execute command");

    json data;
    if (command.argv.empty()) {
        data["command"] = command.command;
    } else {
        data["command"] = command.argv;
    }
    data["sandbox_id"] = sandbox_id_;
    data["timeout"] = command.timeout;
    if (!command.cwd.empty()) {
        data["cwd"] = command.cwd;
    }
    if (!command.env.empty()) {
        data["env"] = command.env;
    }

    logger_->debug("[{}] execute: {}", sandbox_id_, command.display());
    auto timeout = std::max(DEFAULT_REQUEST_TIMEOUT,
                            std::chrono::milliseconds(std::chrono::seconds(command.timeout)));
    return CommandResponse::from_json(call("execute command", "execute", data, timeout));
}

CreateSessionResponse Sandbox::create_session(const CreateSessionRequest& request) {
    require_started("create session");

    json data = request.to_json();
    data["sandbox_id"] = sandbox_id_;
    json result = call("create session", "create_session", data, DEFAULT_REQUEST_TIMEOUT);

    CreateSessionResponse resp;
    resp.output = json_string(result, "output");
    std::string type = json_string(result, "session_type");
    if (!type.empty()) {
        resp.session_type = type;
    }
    logger_->debug("[{}] session {} created", sandbox_id_, request.session);
    return resp;
}

void Sandbox::close_session(const std::string& session) {
    require_started("close session");

    json data;
    data["session"] = session;
    data["sandbox_id"] = sandbox_id_;
    call("close session", "close_session", data, DEFAULT_REQUEST_TIMEOUT);
}

void Sandbox::ensure_session(const std::string& session) {
    CreateSessionRequest request;
    request.session = session;
    try {
        create_session(request);
    } catch (const RemoteCallError& e) {
        if (std::string(e.what()).find("already exists") == std::string::npos) {
            throw;
        }
        logger_->debug("[{}] session {} already exists", sandbox_id_, session);
    }
}

Observation Sandbox::run_in_session(const std::string& command,
                                    const std::string& session,
                                    std::optional<double> timeout_seconds) {
    require_started("run in session");

    json data;
    data["action_type"] = "bash";
    data["session"] = session;
    data["command"] = command;
    data["sandbox_id"] = sandbox_id_;

    auto timeout = DEFAULT_REQUEST_TIMEOUT;
    if (timeout_seconds) {
        data["timeout"] = *timeout_seconds;
        timeout = util::seconds_to_ms(*timeout_seconds);
    }

    return Observation::from_json(call("run in session", "run_in_session", data, timeout));
}

Observation Sandbox::arun(const std::string& cmd, const ArunOptions& options) {
    require_started("arun");

    if (options.mode == RunMode::NOHUP) {
        BackgroundProcessSupervisor supervisor(*this, logger_);
        return supervisor.run(cmd, options);
    }

    std::string session = options.session.value_or("default");
    ensure_session(session);
    return run_in_session(cmd, session, static_cast<double>(options.timeout));
}

// ============================================================================
// Files
// ============================================================================

WriteFileResponse Sandbox::write_file(const std::string& path, const std::string& content) {
    require_started("write file");

    json data;
    data["content"] = content;
    data["path"] = path;
    data["sandbox_id"] = sandbox_id_;

    std::string url = url_ + "/write_file";
    json response = transport_->post_json(url, build_headers(), data, DEFAULT_REQUEST_TIMEOUT);

    WriteFileResponse resp;
    if (!response.is_object() || json_string(response, "status") != "Success") {
        resp.success = false;
        resp.message = fmt::format("Failed to write file {}", path);
        logger_->warn("[{}] {}: {}", sandbox_id_, resp.message, response.dump());
        return resp;
    }
    resp.success = true;
    resp.message = fmt::format("Successfully wrote content to file {}", path);
    return resp;
}

ReadFileResponse Sandbox::read_file(const std::string& path,
                                    const std::string& encoding,
                                    const std::string& errors) {
    require_started("read file");

    json data;
    data["path"] = path;
    data["sandbox_id"] = sandbox_id_;
    if (!encoding.empty()) {
        data["encoding"] = encoding;
    }
    if (!errors.empty()) {
        data["errors"] = errors;
    }

    json result = call("read file", "read_file", data, DEFAULT_REQUEST_TIMEOUT);
    ReadFileResponse resp;
    resp.content = json_string(result, "content");
    return resp;
}

UploadResponse Sandbox::upload(const std::string& source_path, const std::string& target_path) {
    require_started("upload file");

    UploadResponse resp;
    if (!fs::exists(source_path) || !fs::is_regular_file(source_path)) {
        resp.success = false;
        resp.message = fmt::format("File not found: {}", source_path);
        return resp;
    }

    std::ifstream file(source_path, std::ios::binary);
    if (!file) {
        resp.success = false;
        resp.message = fmt::format("Failed to open file: {}", source_path);
        return resp;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    transport::MultipartFile part;
    part.file_name = fs::path(source_path).filename().string();
    part.content = buffer.str();

    std::map<std::string, std::string> fields;
    fields["target_path"] = target_path;
    fields["sandbox_id"] = sandbox_id_;

    std::string url = url_ + "/upload";
    logger_->info("[{}] Uploading {} ({} bytes) to {}", sandbox_id_, source_path, part.content.size(), target_path);
    json response = transport_->post_multipart(url, build_headers(), fields, part, DEFAULT_REQUEST_TIMEOUT);

    resp.file_name = part.file_name;
    if (!response.is_object() || json_string(response, "status") != "Success") {
        resp.success = false;
        resp.message = fmt::format("Upload failed: {}", response.dump());
        return resp;
    }
    resp.success = true;
    resp.message = fmt::format("Successfully uploaded file {} to {}", part.file_name, target_path);
    return resp;
}

std::string Sandbox::to_string() const {
    return fmt::format("Sandbox(sandbox_id={}, host_name={}, image={}, cluster={}, state={})",
        sandbox_id_, host_name_, config_.image, config_.cluster, sandbox_state_to_string(state_));
}

} // namespace rock::runtime
