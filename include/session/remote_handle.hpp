#ifndef FSTORE_SESSION_REMOTE_HANDLE_HPP
#define FSTORE_SESSION_REMOTE_HANDLE_HPP

#include <cstdint>
#include "session/session.hpp"

namespace fstore {
namespace session {

// Owns one remote file key for the lifetime of a transfer. A handle that is
// destroyed while still open is aborted (write) or closed (read) on a
// best-effort basis, so the server never keeps a half-written file.
class RemoteHandle {
public:
  enum class Kind { WRITE, READ };

  RemoteHandle(Session& session, uint64_t key, Kind kind);
  ~RemoteHandle();

  RemoteHandle(const RemoteHandle&) = delete;
  RemoteHandle& operator=(const RemoteHandle&) = delete;
  RemoteHandle(RemoteHandle&& other) noexcept;
  RemoteHandle& operator=(RemoteHandle&& other) noexcept;

  // Normal release: commits a write handle (returns the committed size) or
  // closes a read handle (returns 0). A failed commit still aborts the
  // handle before the error propagates.
  uint64_t release();

  // Best-effort release that never throws
  void abort() noexcept;

  uint64_t key() const { return key_; }
  Kind kind() const { return kind_; }
  bool is_open() const { return open_; }

private:
  Session* session_;
  uint64_t key_;
  Kind kind_;
  bool open_;
};

} // namespace session
} // namespace fstore

#endif // FSTORE_SESSION_REMOTE_HANDLE_HPP
