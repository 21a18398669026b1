#ifndef FSTORE_TRANSFER_CANCEL_TOKEN_HPP
#define FSTORE_TRANSFER_CANCEL_TOKEN_HPP

#include <atomic>

namespace fstore {
namespace transfer {

// Shared between whoever requests an abort and the running engine. Safe to
// set from a signal handler.
class CancelToken {
public:
  void cancel() noexcept { cancelled_.store(true); }
  bool is_cancelled() const noexcept { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace transfer
} // namespace fstore

#endif // FSTORE_TRANSFER_CANCEL_TOKEN_HPP
