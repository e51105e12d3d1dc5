#include "runtime/types.hpp"
#include <sstream>

using json = nlohmann::json;

namespace rock::runtime {

namespace {

// Missing and null fields both read as the default
std::string string_field(const json& j, const char* key, const std::string& def = "") {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::optional<int> int_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<int>();
}

} // namespace

const char* run_mode_to_string(RunMode mode) {
    switch (mode) {
        case RunMode::NORMAL: return "normal";
        case RunMode::NOHUP:  return "nohup";
        default: return "normal";
    }
}

RunMode run_mode_from_string(const std::string& str) {
    if (str == "nohup" || str == "detached") return RunMode::NOHUP;
    return RunMode::NORMAL;
}

// ============================================================================
// Observation
// ============================================================================

json Observation::to_json() const {
    json j;
    j["output"] = output;
    j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
    j["failure_reason"] = failure_reason;
    j["expect_string"] = expect_string;
    return j;
}

Observation Observation::from_json(const json& j) {
    Observation obs;
    if (!j.is_object()) return obs;
    obs.output = string_field(j, "output");
    obs.exit_code = int_field(j, "exit_code");
    obs.failure_reason = string_field(j, "failure_reason");
    obs.expect_string = string_field(j, "expect_string");
    return obs;
}

// ============================================================================
// Command
// ============================================================================

Command Command::shell(std::string command, int timeout) {
    Command cmd;
    cmd.command = std::move(command);
    cmd.timeout = timeout;
    return cmd;
}

Command Command::args(std::vector<std::string> argv, int timeout) {
    Command cmd;
    cmd.argv = std::move(argv);
    cmd.timeout = timeout;
    return cmd;
}

std::string Command::display() const {
    if (argv.empty()) return command;
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << argv[i];
    }
    return oss.str();
}

CommandResponse CommandResponse::from_json(const json& j) {
    CommandResponse resp;
    if (!j.is_object()) return resp;
    resp.stdout_text = string_field(j, "stdout");
    resp.stderr_text = string_field(j, "stderr");
    resp.exit_code = int_field(j, "exit_code");
    return resp;
}

json CommandResponse::to_json() const {
    json j;
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
    return j;
}

// ============================================================================
// Status
// ============================================================================

SandboxStatus SandboxStatus::from_json(const json& j) {
    SandboxStatus st;
    if (!j.is_object()) return st;
    st.sandbox_id = string_field(j, "sandbox_id");
    st.host_name = string_field(j, "host_name");
    st.host_ip = string_field(j, "host_ip");
    auto alive = j.find("is_alive");
    if (alive != j.end() && alive->is_boolean()) {
        st.is_alive = alive->get<bool>();
    }
    st.image = string_field(j, "image");
    auto cpus = j.find("cpus");
    if (cpus != j.end() && cpus->is_number()) {
        st.cpus = cpus->get<double>();
    }
    st.memory = string_field(j, "memory");
    if (j.contains("status")) {
        st.status = j["status"];
    }
    return st;
}

json CreateSessionRequest::to_json() const {
    json j;
    j["session"] = session;
    j["startup_source"] = startup_source;
    j["env_enable"] = env_enable;
    if (!env.empty()) {
        j["env"] = env;
    }
    if (!remote_user.empty()) {
        j["remote_user"] = remote_user;
    }
    return j;
}

} // namespace rock::runtime
