#include "transfer/push_engine.hpp"
#include <utility>
#include <boost/log/trivial.hpp>
#include "crypto/digest.hpp"
#include "session/remote_handle.hpp"
#include "session/session_error.hpp"
#include "transfer/local_file.hpp"

namespace fstore {
namespace transfer {

PushEngine::PushEngine(session::Session& session, TransferDescriptor descriptor,
                       ProgressCallback progress, const CancelToken* cancel)
  : session_(session)
  , descriptor_(std::move(descriptor))
  , progress_(std::move(progress))
  , cancel_(cancel)
  , state_("Push engine", PushState::INIT)
  , blocks_sent_(0) {}

FileResult PushEngine::run() {
  FileResult result;
  result.path = descriptor_.local_path.string();

  auto fail = [&](ErrorKind kind, const std::string& reason) {
    state_.fail(PushState::FAILED);
    result.outcome = Outcome::FAILED;
    result.error = kind;
    result.reason = reason;
    BOOST_LOG_TRIVIAL(error) << "Push engine: " << descriptor_.local_path << " -> " << descriptor_.remote_path
                             << " failed (" << error_kind_to_string(kind) << "): " << reason;
  };

  BOOST_LOG_TRIVIAL(info) << "Push engine: Pushing " << descriptor_.local_path << " -> " << descriptor_.remote_path
                          << " (block " << descriptor_.block_size << ", overwrite "
                          << std::boolalpha << descriptor_.overwrite << ")";

  try {
    result.bytes = transfer();
    result.outcome = Outcome::SUCCESS;
    BOOST_LOG_TRIVIAL(info) << "Push engine: Pushed " << result.bytes << " bytes in " << blocks_sent_ << " block(s)";
  } catch (const TransferError& e) {
    fail(e.kind(), e.what());
  } catch (const session::SessionError& e) {
    fail(classify(e), e.what());
  } catch (const crypto::CryptoError& e) {
    fail(ErrorKind::LOCAL_IO, e.what());
  }

  return result;
}

uint64_t PushEngine::transfer() {
  state_.advance(PushState::NEGOTIATING);

  LocalFileReader reader(descriptor_.local_path);
  descriptor_.total_size = reader.size();
  const uint64_t total = descriptor_.total_size;
  BlockCodec codec(total, descriptor_.block_size);

  std::string hash = crypto::Digest::file_sha256_hex(descriptor_.local_path);
  check_cancel();

  uint64_t key = session_.open_write(descriptor_.remote_path, total, hash, descriptor_.overwrite);
  session::RemoteHandle handle(session_, key, session::RemoteHandle::Kind::WRITE);

  state_.advance(PushState::STREAMING);

  uint64_t sent = 0;
  for (BlockSpec block : codec) {
    check_cancel();

    std::vector<uint8_t> data = reader.read(block);
    session::WriteAck ack = session_.write_block(key, block, data);
    if (ack.index != block.index || ack.length != block.length) {
      throw TransferError(ErrorKind::SHORT_TRANSFER,
                          "block " + std::to_string(block.index) + " acknowledged as index " +
                          std::to_string(ack.index) + " with " + std::to_string(ack.length) + " bytes");
    }

    sent += block.length;
    ++blocks_sent_;
    BOOST_LOG_TRIVIAL(trace) << "Push engine: Block " << block << " acknowledged";
    if (progress_) {
      progress_(sent, total);
    }
  }

  state_.advance(PushState::FINALIZING);
  uint64_t committed = handle.release();
  if (committed != total) {
    throw TransferError(ErrorKind::SHORT_TRANSFER, "remote committed " + std::to_string(committed) +
                        " of " + std::to_string(total) + " bytes");
  }

  state_.advance(PushState::DONE);
  return committed;
}

void PushEngine::check_cancel() const {
  if (cancel_ && cancel_->is_cancelled()) {
    throw TransferError(ErrorKind::CANCELLED, "push cancelled");
  }
}

} // namespace transfer
} // namespace fstore
