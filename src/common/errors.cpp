#include "common/errors.hpp"
#include <fmt/core.h>

namespace rock {

RockError::RockError(const std::string& message, int code)
    : std::runtime_error(message)
    , code_(code) {}

InvalidParameterError::InvalidParameterError(const std::string& message)
    : RockError(message, static_cast<int>(Codes::BAD_REQUEST)) {}

NotStartedError::NotStartedError(const std::string& operation)
    : RockError(fmt::format("Sandbox not started: cannot {}", operation))
    , operation_(operation) {}

StartTimeoutError::StartTimeoutError(const std::string& sandbox_id, int timeout_seconds)
    : RockError(fmt::format("Failed to start sandbox {} within {}s", sandbox_id, timeout_seconds))
    , timeout_seconds_(timeout_seconds) {}

RemoteCallError::RemoteCallError(const std::string& operation, const std::string& url,
                                 const std::string& detail, int code)
    : RockError(fmt::format("Failed to {} ({}): {}", operation, url, detail), code)
    , operation_(operation)
    , url_(url)
    , detail_(detail) {}

BadRequestError::BadRequestError(const std::string& operation, const std::string& url,
                                 const std::string& detail, int code)
    : RemoteCallError(operation, url, detail, code) {}

InternalServerError::InternalServerError(const std::string& operation, const std::string& url,
                                         const std::string& detail, int code)
    : RemoteCallError(operation, url, detail, code) {}

CommandError::CommandError(const std::string& operation, const std::string& url,
                           const std::string& detail, int code)
    : RemoteCallError(operation, url, detail, code) {}

void raise_for_code(int code, const std::string& operation,
                    const std::string& url, const std::string& detail) {
    if (code == 0 || is_success(code)) {
        return;
    }
    if (is_client_error(code)) {
        throw BadRequestError(operation, url, detail, code);
    }
    if (is_server_error(code)) {
        throw InternalServerError(operation, url, detail, code);
    }
    if (is_command_error(code)) {
        throw CommandError(operation, url, detail, code);
    }
    throw RemoteCallError(operation, url, detail, code);
}

} // namespace rock
