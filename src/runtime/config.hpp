#pragma once
#include <map>
#include <optional>
#include <string>

namespace rock::runtime {

// Sandbox configuration
struct SandboxConfig {
    std::string base_url = "http://localhost:8080";   // Admin service root
    std::map<std::string, std::string> extra_headers;

    std::string image = "python:3.11";
    int auto_clear_seconds = 300;         // Remote idle cleanup
    std::optional<std::string> route_key; // Random when unset
    int startup_timeout = 180;            // Seconds to wait for the sandbox to be alive
    std::string memory = "8g";
    double cpus = 2;
    std::string user_id;
    std::string experiment_id;
    std::string cluster = "zb";
    std::string namespace_name;

    // Defaults with base_url and startup_timeout taken from ROCK_* variables
    static SandboxConfig from_env();

    // Throws InvalidParameterError
    void validate() const;
};

// Sandbox group configuration: one template for every member
struct SandboxGroupConfig {
    SandboxConfig sandbox;
    int size = 2;
    int start_concurrency = 2;
    int start_retry_times = 3;

    static SandboxGroupConfig from_env();

    void validate() const;
};

} // namespace rock::runtime
