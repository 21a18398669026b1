#ifndef FSTORE_TRANSFER_PULL_ENGINE_HPP
#define FSTORE_TRANSFER_PULL_ENGINE_HPP

#include <cstdint>
#include "session/remote_handle.hpp"
#include "session/session.hpp"
#include "transfer/cancel_token.hpp"
#include "transfer/local_file.hpp"
#include "transfer/transfer_state.hpp"
#include "transfer/transfer_types.hpp"

namespace fstore {
namespace transfer {

// Downloads one remote file into descriptor.local_path.
//
// SYNC requests one block at a time. ASYNC keeps up to max_concurrency
// read requests outstanding and writes each response at the offset it
// carries, so arrival order does not matter. In both modes every block is
// flushed to disk before its slot counts as free.
//
// A failed pull leaves the partial local file in place, except on a digest
// mismatch where the file is removed.
class PullEngine {
public:
  // Throws std::invalid_argument for an async descriptor with a zero window.
  PullEngine(session::Session& session, TransferDescriptor descriptor,
             ProgressCallback progress = nullptr, const CancelToken* cancel = nullptr);

  PullEngine(const PullEngine&) = delete;
  PullEngine& operator=(const PullEngine&) = delete;

  // Transfer failures are reported in the result rather than thrown.
  // Throws std::invalid_argument for a zero block size.
  FileResult run();

  PullState state() const { return state_.get(); }
  // Largest number of block requests that were outstanding at once
  std::size_t peak_in_flight() const { return peak_in_flight_; }

private:
  session::Session& session_;
  TransferDescriptor descriptor_;
  ProgressCallback progress_;
  const CancelToken* cancel_;
  StateTracker<PullState> state_;
  uint64_t bytes_done_;
  std::size_t peak_in_flight_;

  uint64_t transfer();
  void pull_sync(uint64_t key, const BlockCodec& codec, LocalFileWriter& writer);
  void pull_async(uint64_t key, const BlockCodec& codec, LocalFileWriter& writer);
  // Checks the response against the request, then writes it at its offset
  void store_block(const BlockSpec& requested, const session::BlockData& data, LocalFileWriter& writer);
  bool is_cancelled() const;
};

} // namespace transfer
} // namespace fstore

#endif // FSTORE_TRANSFER_PULL_ENGINE_HPP
