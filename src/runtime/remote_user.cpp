#include "runtime/remote_user.hpp"
#include "runtime/sandbox.hpp"
#include "util/logger.hpp"

namespace rock::runtime {

constexpr int USER_COMMAND_TIMEOUT = 30;

RemoteUser::RemoteUser(Sandbox& sandbox)
    : sandbox_(sandbox)
    , logger_(util::get_logger("rock.sandbox.user")) {}

bool RemoteUser::is_user_exist(const std::string& user_name) {
    CommandResponse response = sandbox_.execute(
        Command::args({"id", user_name}, USER_COMMAND_TIMEOUT));
    if (response.exit_code && *response.exit_code == 0) {
        logger_->info("user {} already exists", user_name);
        return true;
    }
    return false;
}

bool RemoteUser::create_remote_user(const std::string& user_name) {
    if (is_user_exist(user_name)) {
        return true;
    }

    CommandResponse response = sandbox_.execute(
        Command::args({"useradd", "-m", "-s", "/bin/bash", user_name}, USER_COMMAND_TIMEOUT));
    logger_->info("useradd {} response: {}", user_name, response.to_json().dump());
    return response.exit_code && *response.exit_code == 0;
}

} // namespace rock::runtime
