#pragma once
#include <string>

namespace rock {

// Status codes reported by the sandbox service
enum class Codes : int {
    OK = 2000,
    BAD_REQUEST = 4000,
    INTERNAL_SERVER_ERROR = 5000,
    COMMAND_ERROR = 6000
};

inline std::string reason_phrase(Codes code) {
    switch (code) {
        case Codes::OK:                    return "OK";
        case Codes::BAD_REQUEST:           return "Bad Request";
        case Codes::INTERNAL_SERVER_ERROR: return "Internal Server Error";
        case Codes::COMMAND_ERROR:         return "Command Error";
        default: return "";
    }
}

inline bool is_success(int code)      { return code >= 2000 && code <= 2999; }
inline bool is_client_error(int code) { return code >= 4000 && code <= 4999; }
inline bool is_server_error(int code) { return code >= 5000 && code <= 5999; }
inline bool is_command_error(int code){ return code >= 6000 && code <= 6999; }
inline bool is_error(int code)        { return code >= 4000 && code <= 6999; }

} // namespace rock
