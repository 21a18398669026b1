#ifndef FSTORE_TRANSFER_ERROR_HPP
#define FSTORE_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>
#include "session/session_error.hpp"

namespace fstore {
namespace transfer {

enum class ErrorKind {
  NONE,
  ALREADY_EXISTS,
  TRANSPORT_ERROR,
  REMOTE_REJECTED,
  SHORT_TRANSFER,
  HASH_MISMATCH,
  LOCAL_IO,
  CANCELLED
};

inline const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:            return "None";
    case ErrorKind::ALREADY_EXISTS:  return "AlreadyExists";
    case ErrorKind::TRANSPORT_ERROR: return "TransportError";
    case ErrorKind::REMOTE_REJECTED: return "RemoteRejected";
    case ErrorKind::SHORT_TRANSFER:  return "ShortTransfer";
    case ErrorKind::HASH_MISMATCH:   return "HashMismatch";
    case ErrorKind::LOCAL_IO:        return "LocalIO";
    case ErrorKind::CANCELLED:       return "Cancelled";
    default:                         return "Unknown";
  }
}

class TransferError : public std::runtime_error {
public:
  TransferError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// How a session failure counts against a file transfer
inline ErrorKind classify(const session::SessionError& error) {
  if (error.code() != session::SessionErrorCode::REMOTE) {
    return ErrorKind::TRANSPORT_ERROR;
  }
  return error.status() == session::RemoteStatus::ALREADY_EXISTS ? ErrorKind::ALREADY_EXISTS
                                                                 : ErrorKind::REMOTE_REJECTED;
}

} // namespace transfer
} // namespace fstore

#endif // FSTORE_TRANSFER_ERROR_HPP
