#ifndef FSTORE_TRANSFER_TYPES_HPP
#define FSTORE_TRANSFER_TYPES_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "transfer/block_codec.hpp"
#include "transfer/transfer_error.hpp"

namespace fstore {
namespace transfer {

enum class TransferMode {
  SYNC,
  ASYNC
};

inline const char* mode_to_string(TransferMode mode) {
  return mode == TransferMode::ASYNC ? "async" : "sync";
}

// Everything one file transfer needs. Fixed once the transfer starts.
struct TransferDescriptor {
  std::filesystem::path local_path;
  std::string remote_path;
  uint64_t total_size{0};
  uint32_t block_size{BlockCodec::DEFAULT_BLOCK_SIZE};
  bool overwrite{false};
  TransferMode mode{TransferMode::SYNC};
  // Window size of an async pull
  std::size_t max_concurrency{4};
};

enum class Outcome {
  SUCCESS,
  SKIPPED,
  FAILED
};

inline const char* outcome_to_string(Outcome outcome) {
  switch (outcome) {
    case Outcome::SUCCESS: return "Success";
    case Outcome::SKIPPED: return "Skipped";
    case Outcome::FAILED:  return "Failed";
    default:               return "Unknown";
  }
}

struct FileResult {
  std::string path;
  Outcome outcome{Outcome::SUCCESS};
  ErrorKind error{ErrorKind::NONE};
  std::string reason;
  uint64_t bytes{0};

  bool ok() const { return outcome != Outcome::FAILED; }
};

struct TransferReport {
  std::vector<FileResult> results;
  // Set when the walk stopped early; the remaining files were not attempted
  bool aborted{false};
  std::string abort_reason;

  std::size_t count(Outcome outcome) const {
    std::size_t n = 0;
    for (const auto& result : results) {
      if (result.outcome == outcome) {
        ++n;
      }
    }
    return n;
  }

  bool succeeded() const { return !aborted && count(Outcome::FAILED) == 0; }
};

// (bytes durably transferred, total bytes), called after every block
using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

} // namespace transfer
} // namespace fstore

#endif // FSTORE_TRANSFER_TYPES_HPP
