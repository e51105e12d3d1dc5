#pragma once
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "runtime/types.hpp"

namespace rock::runtime {

class Sandbox;

struct ExecuteScriptRequest {
    std::string script_content;
    std::optional<std::string> script_name;  // Default: script_<ms>.sh
    int wait_timeout = 300;                  // Seconds
    int wait_interval = 10;                  // Seconds
    bool cleanup = true;                     // Remove the script afterwards
};

// Script execution: the script is written to /tmp and run detached
class Process {
public:
    explicit Process(Sandbox& sandbox);

    // Failures come back as an Observation with exit code 1
    Observation execute_script(const ExecuteScriptRequest& request);

private:
    Sandbox& sandbox_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace rock::runtime
