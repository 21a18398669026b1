#ifndef FSTORE_SESSION_ERROR_HPP
#define FSTORE_SESSION_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fstore {
namespace session {

enum class SessionErrorCode {
    TIMEOUT,
    CONNECTION_FAILED,
    CONNECTION_LOST,
    PROTOCOL,
    REMOTE
};

// Status codes carried by RESPONSE_ERROR frames
enum class RemoteStatus : uint8_t {
    OK = 0,
    ALREADY_EXISTS = 1,
    NOT_FOUND = 2,
    REJECTED = 3,
    INVALID = 4
};

inline const char* session_error_to_string(SessionErrorCode code) {
    switch (code) {
        case SessionErrorCode::TIMEOUT: return "Timeout";
        case SessionErrorCode::CONNECTION_FAILED: return "Connection failed";
        case SessionErrorCode::CONNECTION_LOST: return "Connection lost";
        case SessionErrorCode::PROTOCOL: return "Protocol error";
        case SessionErrorCode::REMOTE: return "Remote error";
        default: return "Undefined error";
    }
}

inline const char* remote_status_to_string(RemoteStatus status) {
    switch (status) {
        case RemoteStatus::OK: return "Ok";
        case RemoteStatus::ALREADY_EXISTS: return "Already exists";
        case RemoteStatus::NOT_FOUND: return "Not found";
        case RemoteStatus::REJECTED: return "Rejected";
        case RemoteStatus::INVALID: return "Invalid request";
        default: return "Unknown status";
    }
}

class SessionError : public std::runtime_error {
public:
    SessionError(SessionErrorCode code, const std::string& message)
        : std::runtime_error(std::string(session_error_to_string(code)) + ": " + message)
        , code_(code)
        , status_(RemoteStatus::OK) {}

    // Error reported by the server in a RESPONSE_ERROR frame
    SessionError(RemoteStatus status, const std::string& message)
        : std::runtime_error(std::string(remote_status_to_string(status)) + ": " + message)
        , code_(SessionErrorCode::REMOTE)
        , status_(status) {}

    SessionErrorCode code() const { return code_; }
    RemoteStatus status() const { return status_; }

    // Errors after which no further request on the session can succeed
    bool is_session_fatal() const {
        return code_ == SessionErrorCode::CONNECTION_LOST ||
               code_ == SessionErrorCode::CONNECTION_FAILED;
    }

private:
    SessionErrorCode code_;
    RemoteStatus status_;
};

} // namespace session
} // namespace fstore

#endif // FSTORE_SESSION_ERROR_HPP
