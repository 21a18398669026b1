#include "session/remote_handle.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace fstore {
namespace session {

RemoteHandle::RemoteHandle(Session& session, uint64_t key, Kind kind)
  : session_(&session)
  , key_(key)
  , kind_(kind)
  , open_(true) {
  BOOST_LOG_TRIVIAL(debug) << "Remote handle: Acquired " << (kind_ == Kind::WRITE ? "write" : "read")
                           << " key " << key_;
}

RemoteHandle::~RemoteHandle() {
  abort();
}

RemoteHandle::RemoteHandle(RemoteHandle&& other) noexcept
  : session_(other.session_)
  , key_(other.key_)
  , kind_(other.kind_)
  , open_(std::exchange(other.open_, false)) {}

RemoteHandle& RemoteHandle::operator=(RemoteHandle&& other) noexcept {
  if (this != &other) {
    abort();
    session_ = other.session_;
    key_ = other.key_;
    kind_ = other.kind_;
    open_ = std::exchange(other.open_, false);
  }
  return *this;
}

uint64_t RemoteHandle::release() {
  if (!open_) {
    return 0;
  }

  if (kind_ == Kind::READ) {
    open_ = false;
    session_->close_read(key_);
    BOOST_LOG_TRIVIAL(debug) << "Remote handle: Closed read key " << key_;
    return 0;
  }

  try {
    uint64_t committed = session_->finish_write(key_);
    open_ = false;
    BOOST_LOG_TRIVIAL(debug) << "Remote handle: Committed write key " << key_ << " (" << committed << " bytes)";
    return committed;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Remote handle: Commit of key " << key_ << " failed: " << e.what();
    abort();
    throw;
  }
}

void RemoteHandle::abort() noexcept {
  if (!open_) {
    return;
  }
  open_ = false;

  try {
    if (kind_ == Kind::WRITE) {
      session_->abort_write(key_);
    } else {
      session_->close_read(key_);
    }
    BOOST_LOG_TRIVIAL(info) << "Remote handle: Released key " << key_ << " after failure";
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Remote handle: Best-effort release of key " << key_ << " failed: " << e.what();
  }
}

} // namespace session
} // namespace fstore
