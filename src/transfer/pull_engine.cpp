#include "transfer/pull_engine.hpp"
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/log/trivial.hpp>
#include "crypto/digest.hpp"
#include "session/session_error.hpp"

namespace fstore {
namespace transfer {

namespace {

struct Completion {
  BlockSpec block;
  session::BlockData data;
  std::exception_ptr error;
};

// Filled from session threads, drained by the engine thread. Shared with
// the callbacks so a late completion never touches a dead queue.
class CompletionQueue {
public:
  void push(Completion completion) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      completions_.push_back(std::move(completion));
    }
    ready_.notify_one();
  }

  Completion pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return !completions_.empty(); });
    Completion completion = std::move(completions_.front());
    completions_.pop_front();
    return completion;
  }

private:
  std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<Completion> completions_;
};

} // namespace

PullEngine::PullEngine(session::Session& session, TransferDescriptor descriptor,
                       ProgressCallback progress, const CancelToken* cancel)
  : session_(session)
  , descriptor_(std::move(descriptor))
  , progress_(std::move(progress))
  , cancel_(cancel)
  , state_("Pull engine", PullState::INIT)
  , bytes_done_(0)
  , peak_in_flight_(0) {
  if (descriptor_.mode == TransferMode::ASYNC && descriptor_.max_concurrency == 0) {
    throw std::invalid_argument("Pull engine: async window must be greater than zero");
  }
}

FileResult PullEngine::run() {
  FileResult result;
  result.path = descriptor_.remote_path;

  auto fail = [&](ErrorKind kind, const std::string& reason) {
    state_.fail(PullState::FAILED);
    result.outcome = Outcome::FAILED;
    result.error = kind;
    result.reason = reason;
    BOOST_LOG_TRIVIAL(error) << "Pull engine: " << descriptor_.remote_path << " -> " << descriptor_.local_path
                             << " failed (" << error_kind_to_string(kind) << "): " << reason;
  };

  BOOST_LOG_TRIVIAL(info) << "Pull engine: Pulling " << descriptor_.remote_path << " -> " << descriptor_.local_path
                          << " (" << mode_to_string(descriptor_.mode) << ", block " << descriptor_.block_size << ")";

  try {
    result.bytes = transfer();
    result.outcome = Outcome::SUCCESS;
    BOOST_LOG_TRIVIAL(info) << "Pull engine: Pulled " << result.bytes << " bytes";
  } catch (const TransferError& e) {
    fail(e.kind(), e.what());
  } catch (const session::SessionError& e) {
    fail(classify(e), e.what());
  } catch (const crypto::CryptoError& e) {
    fail(ErrorKind::LOCAL_IO, e.what());
  }

  return result;
}

uint64_t PullEngine::transfer() {
  state_.advance(PullState::OPENING);

  std::error_code ec;
  if (!descriptor_.overwrite && std::filesystem::exists(descriptor_.local_path, ec)) {
    throw TransferError(ErrorKind::ALREADY_EXISTS, descriptor_.local_path.string() + " already exists");
  }
  if (is_cancelled()) {
    throw TransferError(ErrorKind::CANCELLED, "pull cancelled");
  }

  session::ReadGrant grant = session_.open_read(descriptor_.remote_path);
  session::RemoteHandle handle(session_, grant.key, session::RemoteHandle::Kind::READ);
  descriptor_.total_size = grant.info.size;
  BlockCodec codec(descriptor_.total_size, descriptor_.block_size);

  state_.advance(PullState::TRANSFERRING);

  LocalFileWriter writer(descriptor_.local_path, descriptor_.total_size);
  if (descriptor_.mode == TransferMode::ASYNC) {
    pull_async(grant.key, codec, writer);
  } else {
    pull_sync(grant.key, codec, writer);
  }
  writer.close();

  if (bytes_done_ != descriptor_.total_size) {
    throw TransferError(ErrorKind::SHORT_TRANSFER, "received " + std::to_string(bytes_done_) + " of " +
                        std::to_string(descriptor_.total_size) + " bytes");
  }

  state_.advance(PullState::CLOSING);
  handle.release();

  if (grant.info.hash && !grant.info.hash->empty()) {
    std::string actual = crypto::Digest::file_sha256_hex(descriptor_.local_path);
    if (!boost::algorithm::iequals(actual, *grant.info.hash)) {
      writer.discard();
      throw TransferError(ErrorKind::HASH_MISMATCH, "digest " + actual + " does not match remote " +
                          *grant.info.hash);
    }
    BOOST_LOG_TRIVIAL(debug) << "Pull engine: Digest verified";
  }

  state_.advance(PullState::DONE);
  return descriptor_.total_size;
}

void PullEngine::pull_sync(uint64_t key, const BlockCodec& codec, LocalFileWriter& writer) {
  if (codec.block_count() > 0) {
    peak_in_flight_ = 1;
  }
  for (BlockSpec block : codec) {
    if (is_cancelled()) {
      throw TransferError(ErrorKind::CANCELLED, "pull cancelled");
    }
    session::BlockData data = session_.read_block(key, block);
    store_block(block, data, writer);
  }
}

void PullEngine::pull_async(uint64_t key, const BlockCodec& codec, LocalFileWriter& writer) {
  auto queue = std::make_shared<CompletionQueue>();
  const uint64_t block_count = codec.block_count();
  const std::size_t window = descriptor_.max_concurrency;

  uint64_t next = 0;
  std::size_t in_flight = 0;
  std::exception_ptr first_error;

  BOOST_LOG_TRIVIAL(debug) << "Pull engine: " << block_count << " block(s), window " << window;

  for (;;) {
    // Refill the window unless something already went wrong
    while (!first_error && next < block_count && in_flight < window) {
      if (is_cancelled()) {
        first_error = std::make_exception_ptr(TransferError(ErrorKind::CANCELLED, "pull cancelled"));
        break;
      }

      BlockSpec block = codec.block_at(next);
      ++in_flight;
      try {
        session_.read_block_async(key, block,
          [queue](const BlockSpec& requested, session::BlockData data, std::exception_ptr error) {
            queue->push(Completion{requested, std::move(data), error});
          });
      } catch (const std::exception& e) {
        --in_flight;
        BOOST_LOG_TRIVIAL(error) << "Pull engine: Could not request block " << block << ": " << e.what();
        first_error = std::current_exception();
        break;
      }
      ++next;
      if (in_flight > peak_in_flight_) {
        peak_in_flight_ = in_flight;
      }
    }

    if (in_flight == 0) {
      break;
    }

    Completion completion = queue->pop();
    --in_flight;

    if (completion.error) {
      if (!first_error) {
        first_error = completion.error;
      }
      continue;
    }

    // Blocks that already arrived are still written after a failure
    try {
      store_block(completion.block, completion.data, writer);
    } catch (const std::exception&) {
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }

  if (first_error) {
    BOOST_LOG_TRIVIAL(debug) << "Pull engine: Window drained after failure";
    std::rethrow_exception(first_error);
  }
}

void PullEngine::store_block(const BlockSpec& requested, const session::BlockData& data,
                             LocalFileWriter& writer) {
  if (data.index != requested.index || data.offset != requested.offset) {
    throw TransferError(ErrorKind::SHORT_TRANSFER,
                        "response for block " + std::to_string(requested.index) + " names block " +
                        std::to_string(data.index) + " at offset " + std::to_string(data.offset));
  }
  if (data.bytes.size() != requested.length) {
    throw TransferError(ErrorKind::SHORT_TRANSFER,
                        "block " + std::to_string(requested.index) + " returned " +
                        std::to_string(data.bytes.size()) + " of " + std::to_string(requested.length) + " bytes");
  }

  writer.write_at(data.offset, data.bytes);
  bytes_done_ += data.bytes.size();
  BOOST_LOG_TRIVIAL(trace) << "Pull engine: Block " << requested << " written";

  if (progress_) {
    progress_(bytes_done_, descriptor_.total_size);
  }
}

bool PullEngine::is_cancelled() const {
  return cancel_ && cancel_->is_cancelled();
}

} // namespace transfer
} // namespace fstore
