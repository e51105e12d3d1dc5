#include "runtime/network.hpp"
#include "runtime/sandbox.hpp"
#include "common/errors.hpp"
#include "util/logger.hpp"

#include <fmt/core.h>

namespace rock::runtime {

namespace {

// Single-quote for bash: ' becomes '\''
std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string apt_command(const std::string& mirror_url) {
    return fmt::format(
        "cat > /etc/apt/sources.list << 'EOF'\n"
        "deb {0} $(lsb_release -cs) main restricted universe multiverse\n"
        "deb {0} $(lsb_release -cs)-updates main restricted universe multiverse\n"
        "deb {0} $(lsb_release -cs)-backports main restricted universe multiverse\n"
        "deb {0} $(lsb_release -cs)-security main restricted universe multiverse\n"
        "EOF\n"
        "apt-get update",
        mirror_url);
}

std::string pip_command(const std::string& index_url) {
    return fmt::format(
        "mkdir -p ~/.pip && cat > ~/.pip/pip.conf << EOF\n"
        "[global]\n"
        "index-url = {0}\n"
        "trusted-host = $(echo {0} | sed 's|https\\?://||' | cut -d'/' -f1)\n"
        "EOF",
        index_url);
}

std::string github_command(const std::string& ip_address) {
    return fmt::format("echo \"{} github.com\" >> /etc/hosts", ip_address);
}

} // namespace

const char* speedup_type_to_string(SpeedupType type) {
    switch (type) {
        case SpeedupType::APT:    return "apt";
        case SpeedupType::PIP:    return "pip";
        case SpeedupType::GITHUB: return "github";
        default: return "unknown";
    }
}

std::string build_speedup_command(SpeedupType type, const std::string& value) {
    if (value.empty()) {
        throw InvalidParameterError(fmt::format("{} speedup value is empty", speedup_type_to_string(type)));
    }
    switch (type) {
        case SpeedupType::APT:    return apt_command(value);
        case SpeedupType::PIP:    return pip_command(value);
        case SpeedupType::GITHUB: return github_command(value);
    }
    throw InvalidParameterError("Unsupported speedup type");
}

Network::Network(Sandbox& sandbox)
    : sandbox_(sandbox)
    , logger_(util::get_logger("rock.sandbox.network")) {}

Observation Network::speedup(SpeedupType type, const std::string& value, int timeout) {
    logger_->info("[{}] Configuring {} speedup: {}",
        sandbox_.sandbox_id(), speedup_type_to_string(type), value);

    // Multi-line scripts go through bash -c so nohup sees a single command
    std::string script = build_speedup_command(type, value);
    ArunOptions options;
    options.mode = RunMode::NOHUP;
    options.wait_timeout = timeout;
    return sandbox_.arun("bash -c " + shell_quote(script), options);
}

} // namespace rock::runtime
