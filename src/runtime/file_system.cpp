#include "runtime/file_system.hpp"
#include "runtime/sandbox.hpp"
#include "common/errors.hpp"
#include "util/logger.hpp"

namespace rock::runtime {

namespace {

constexpr int FS_COMMAND_TIMEOUT = 300;

ChownResponse run_fs_command(Sandbox& sandbox, std::vector<std::string> argv) {
    CommandResponse response = sandbox.execute(Command::args(std::move(argv), FS_COMMAND_TIMEOUT));
    ChownResponse result;
    result.success = response.exit_code && *response.exit_code == 0;
    result.message = response.to_json().dump();
    return result;
}

} // namespace

FileSystem::FileSystem(Sandbox& sandbox)
    : sandbox_(sandbox)
    , logger_(util::get_logger("rock.sandbox.fs")) {}

ChownResponse FileSystem::chown(const ChownRequest& request) {
    if (request.paths.empty()) {
        throw InvalidParameterError("paths is empty");
    }
    if (request.remote_user.empty()) {
        throw InvalidParameterError("remote_user is empty");
    }

    std::vector<std::string> argv{"chown"};
    if (request.recursive) {
        argv.push_back("-R");
    }
    argv.push_back(request.remote_user + ":" + request.remote_user);
    argv.insert(argv.end(), request.paths.begin(), request.paths.end());

    logger_->info("chown command: {}", Command::args(argv).display());
    return run_fs_command(sandbox_, std::move(argv));
}

ChmodResponse FileSystem::chmod(const ChmodRequest& request) {
    if (request.paths.empty()) {
        throw InvalidParameterError("paths is empty");
    }

    std::vector<std::string> argv{"chmod"};
    if (request.recursive) {
        argv.push_back("-R");
    }
    argv.push_back(request.mode);
    argv.insert(argv.end(), request.paths.begin(), request.paths.end());

    logger_->info("chmod command: {}", Command::args(argv).display());
    return run_fs_command(sandbox_, std::move(argv));
}

} // namespace rock::runtime
