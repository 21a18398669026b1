#ifndef FSTORE_TRANSFER_PUSH_ENGINE_HPP
#define FSTORE_TRANSFER_PUSH_ENGINE_HPP

#include <cstdint>
#include "session/session.hpp"
#include "transfer/cancel_token.hpp"
#include "transfer/transfer_state.hpp"
#include "transfer/transfer_types.hpp"

namespace fstore {
namespace transfer {

// Uploads one local file. Blocks go out strictly in index order and each
// one waits for its acknowledgement before the next is read, whatever the
// descriptor's mode says.
class PushEngine {
public:
  PushEngine(session::Session& session, TransferDescriptor descriptor,
             ProgressCallback progress = nullptr, const CancelToken* cancel = nullptr);

  PushEngine(const PushEngine&) = delete;
  PushEngine& operator=(const PushEngine&) = delete;

  // Runs the transfer to completion. Transfer failures are reported in the
  // result rather than thrown. The remote handle is released on every path.
  // Throws std::invalid_argument for a zero block size.
  FileResult run();

  PushState state() const { return state_.get(); }
  uint64_t blocks_sent() const { return blocks_sent_; }

private:
  session::Session& session_;
  TransferDescriptor descriptor_;
  ProgressCallback progress_;
  const CancelToken* cancel_;
  StateTracker<PushState> state_;
  uint64_t blocks_sent_;

  // Returns the committed size
  uint64_t transfer();
  void check_cancel() const;
};

} // namespace transfer
} // namespace fstore

#endif // FSTORE_TRANSFER_PUSH_ENGINE_HPP
