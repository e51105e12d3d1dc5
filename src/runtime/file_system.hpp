#pragma once
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace rock::runtime {

class Sandbox;

struct ChownRequest {
    std::string remote_user;
    std::vector<std::string> paths;
    bool recursive = false;
};

struct ChmodRequest {
    std::vector<std::string> paths;
    std::string mode = "755";
    bool recursive = false;
};

struct ChownResponse {
    bool success = false;
    std::string message;   // Command response as JSON
};

using ChmodResponse = ChownResponse;

// Ownership and permission changes on remote paths
class FileSystem {
public:
    explicit FileSystem(Sandbox& sandbox);

    // Both throw InvalidParameterError on empty paths
    ChownResponse chown(const ChownRequest& request);
    ChmodResponse chmod(const ChmodRequest& request);

private:
    Sandbox& sandbox_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace rock::runtime
