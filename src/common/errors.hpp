/**
 * rock error taxonomy
 *
 * Every error thrown by the SDK derives from RockError and carries a status
 * code (see codes.hpp, 0 when the service did not report one). Remote call
 * failures additionally record the operation and URL that failed.
 *
 * Detached execution failures (launch failure, PID extraction failure,
 * completion timeout) are not thrown; they come back in the Observation.
 */
#pragma once
#include <stdexcept>
#include <string>
#include "common/codes.hpp"

namespace rock {

class RockError : public std::runtime_error {
public:
    explicit RockError(const std::string& message, int code = 0);

    int code() const { return code_; }

private:
    int code_;
};

// Bad configuration or arguments supplied by the caller
class InvalidParameterError : public RockError {
public:
    explicit InvalidParameterError(const std::string& message);
};

// Identity-requiring operation invoked before the sandbox is alive
class NotStartedError : public RockError {
public:
    explicit NotStartedError(const std::string& operation);

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

// start() did not observe an alive sandbox within the startup timeout
class StartTimeoutError : public RockError {
public:
    StartTimeoutError(const std::string& sandbox_id, int timeout_seconds);

    int timeout_seconds() const { return timeout_seconds_; }

private:
    int timeout_seconds_;
};

// Transport failure or non-success response envelope
class RemoteCallError : public RockError {
public:
    RemoteCallError(const std::string& operation, const std::string& url,
                    const std::string& detail, int code = 0);

    const std::string& operation() const { return operation_; }
    const std::string& url() const { return url_; }
    const std::string& detail() const { return detail_; }

private:
    std::string operation_;
    std::string url_;
    std::string detail_;
};

// 4xxx
class BadRequestError : public RemoteCallError {
public:
    BadRequestError(const std::string& operation, const std::string& url,
                    const std::string& detail,
                    int code = static_cast<int>(Codes::BAD_REQUEST));
};

// 5xxx
class InternalServerError : public RemoteCallError {
public:
    InternalServerError(const std::string& operation, const std::string& url,
                        const std::string& detail,
                        int code = static_cast<int>(Codes::INTERNAL_SERVER_ERROR));
};

// 6xxx, also used for commands that exited nonzero where a success was required
class CommandError : public RemoteCallError {
public:
    CommandError(const std::string& operation, const std::string& url,
                 const std::string& detail,
                 int code = static_cast<int>(Codes::COMMAND_ERROR));
};

// Throw the RemoteCallError subclass matching code. Returns normally for
// success codes and for 0 (no code reported).
void raise_for_code(int code, const std::string& operation,
                    const std::string& url, const std::string& detail);

} // namespace rock
