#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "runtime/types.hpp"

namespace rock::runtime {

class Sandbox;

enum class SpeedupType {
    APT,      // Debian/Ubuntu mirror URL
    PIP,      // PyPI index URL
    GITHUB    // github.com IP address pinned in /etc/hosts
};

const char* speedup_type_to_string(SpeedupType type);

// Shell command applying one speedup setting
std::string build_speedup_command(SpeedupType type, const std::string& value);

// Package mirror and host acceleration
class Network {
public:
    explicit Network(Sandbox& sandbox);

    // Runs the configuration detached, bounded by timeout seconds
    Observation speedup(SpeedupType type, const std::string& value, int timeout = 300);

private:
    Sandbox& sandbox_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace rock::runtime
