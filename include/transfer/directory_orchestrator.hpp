#ifndef FSTORE_TRANSFER_DIRECTORY_ORCHESTRATOR_HPP
#define FSTORE_TRANSFER_DIRECTORY_ORCHESTRATOR_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include "session/session.hpp"
#include "transfer/cancel_token.hpp"
#include "transfer/transfer_types.hpp"

namespace fstore {
namespace transfer {

struct ImageOptions {
  // Remote directory the image root is placed under
  std::string remote_dir;
  uint32_t block_size{BlockCodec::DEFAULT_BLOCK_SIZE};
  bool overwrite{false};
  // Ask the server to approve every remote path before any data moves
  bool preflight{true};
};

// Pushes a local directory tree ("image") one file at a time.
class DirectoryOrchestrator {
public:
  // (remote path, bytes done, total bytes) of the file currently moving
  using FileProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t)>;

  DirectoryOrchestrator(session::Session& session, ImageOptions options,
                        const CancelToken* cancel = nullptr);

  void set_progress(FileProgressCallback progress) { progress_ = std::move(progress); }

  // Walks root and pushes every regular file. Per-file failures, and
  // subdirectories that cannot be listed, are recorded and the walk goes on; a lost session, a refused pre-flight or
  // a cancellation ends it with report.aborted set.
  // Throws TransferError(LOCAL_IO) when root is not a readable, non-empty
  // directory.
  TransferReport push_tree(const std::filesystem::path& root);

private:
  struct Entry {
    enum class Kind { REGULAR, SPECIAL, UNREADABLE };

    std::filesystem::path local_path;
    std::string remote_path;
    Kind kind;
    // Why an UNREADABLE directory could not be listed
    std::string error;
  };

  session::Session& session_;
  ImageOptions options_;
  const CancelToken* cancel_;
  FileProgressCallback progress_;

  std::vector<Entry> collect(const std::filesystem::path& root) const;
  bool preflight(const std::vector<Entry>& entries, TransferReport& report);
};

} // namespace transfer
} // namespace fstore

#endif // FSTORE_TRANSFER_DIRECTORY_ORCHESTRATOR_HPP
