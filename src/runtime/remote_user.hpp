#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace rock::runtime {

class Sandbox;

// Linux user accounts inside the sandbox
class RemoteUser {
public:
    explicit RemoteUser(Sandbox& sandbox);

    const std::string& current_user() const { return current_user_; }

    // `id <name>` exits 0
    bool is_user_exist(const std::string& user_name);

    // useradd -m -s /bin/bash; true if the user exists afterwards
    bool create_remote_user(const std::string& user_name);

private:
    Sandbox& sandbox_;
    std::shared_ptr<spdlog::logger> logger_;
    std::string current_user_ = "root";
};

} // namespace rock::runtime
