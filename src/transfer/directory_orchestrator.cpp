#include "transfer/directory_orchestrator.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include "session/session_error.hpp"
#include "transfer/push_engine.hpp"
#include "transfer/remote_path.hpp"

namespace fstore {
namespace transfer {

DirectoryOrchestrator::DirectoryOrchestrator(session::Session& session, ImageOptions options,
                                             const CancelToken* cancel)
  : session_(session)
  , options_(std::move(options))
  , cancel_(cancel) {}

TransferReport DirectoryOrchestrator::push_tree(const std::filesystem::path& root) {
  std::vector<Entry> entries = collect(root);
  TransferReport report;

  BOOST_LOG_TRIVIAL(info) << "Directory orchestrator: " << entries.size() << " entries under " << root
                          << " -> '" << options_.remote_dir << "'";

  if (options_.preflight && !preflight(entries, report)) {
    return report;
  }

  for (const Entry& entry : entries) {
    if (cancel_ && cancel_->is_cancelled()) {
      report.aborted = true;
      report.abort_reason = "cancelled";
      break;
    }

    if (entry.kind == Entry::Kind::UNREADABLE) {
      FileResult failed;
      failed.path = entry.local_path.string();
      failed.outcome = Outcome::FAILED;
      failed.error = ErrorKind::LOCAL_IO;
      failed.reason = "cannot read directory: " + entry.error;
      report.results.push_back(std::move(failed));
      continue;
    }

    if (entry.kind == Entry::Kind::SPECIAL) {
      FileResult skipped;
      skipped.path = entry.local_path.string();
      skipped.outcome = Outcome::SKIPPED;
      skipped.reason = "not a regular file";
      BOOST_LOG_TRIVIAL(info) << "Directory orchestrator: Skipping " << entry.local_path;
      report.results.push_back(std::move(skipped));
      continue;
    }

    TransferDescriptor descriptor;
    descriptor.local_path = entry.local_path;
    descriptor.remote_path = entry.remote_path;
    descriptor.block_size = options_.block_size;
    descriptor.overwrite = options_.overwrite;
    descriptor.mode = TransferMode::SYNC;

    ProgressCallback progress;
    if (progress_) {
      const std::string remote = entry.remote_path;
      progress = [this, remote](uint64_t done, uint64_t total) { progress_(remote, done, total); };
    }

    PushEngine engine(session_, descriptor, progress, cancel_);
    FileResult result = engine.run();
    report.results.push_back(result);

    if (result.error == ErrorKind::CANCELLED) {
      report.aborted = true;
      report.abort_reason = "cancelled";
      break;
    }
    if (result.error == ErrorKind::TRANSPORT_ERROR && session_.is_lost()) {
      report.aborted = true;
      report.abort_reason = "session lost: " + result.reason;
      BOOST_LOG_TRIVIAL(error) << "Directory orchestrator: Session lost, abandoning remaining files";
      break;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Directory orchestrator: " << report.count(Outcome::SUCCESS) << " pushed, "
                          << report.count(Outcome::SKIPPED) << " skipped, "
                          << report.count(Outcome::FAILED) << " failed"
                          << (report.aborted ? " (aborted: " + report.abort_reason + ")" : "");
  return report;
}

std::vector<DirectoryOrchestrator::Entry> DirectoryOrchestrator::collect(const std::filesystem::path& root) const {
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path base = fs::absolute(root, ec).lexically_normal();
  if (ec || !fs::is_directory(base, ec)) {
    throw TransferError(ErrorKind::LOCAL_IO, root.string() + " is not a directory");
  }

  std::vector<Entry> entries;
  auto unreadable = [&](const fs::path& dir, const std::error_code& error) {
    BOOST_LOG_TRIVIAL(warning) << "Directory orchestrator: Cannot read " << dir << ": " << error.message();
    entries.push_back(Entry{dir, image_remote_path(options_.remote_dir, base, dir),
                            Entry::Kind::UNREADABLE, error.message()});
  };

  std::vector<fs::path> pending{base};
  while (!pending.empty()) {
    fs::path dir = std::move(pending.back());
    pending.pop_back();

    fs::directory_iterator it(dir, ec);
    if (ec && dir == base) {
      throw TransferError(ErrorKind::LOCAL_IO, "cannot read " + root.string() + ": " + ec.message());
    }

    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
      std::error_code status_ec;
      const fs::directory_entry& dir_entry = *it;
      bool symlink = dir_entry.is_symlink(status_ec);
      if (!symlink && dir_entry.is_directory(status_ec)) {
        pending.push_back(dir_entry.path());
        continue;
      }

      bool regular = !symlink && dir_entry.is_regular_file(status_ec);
      entries.push_back(Entry{dir_entry.path(), image_remote_path(options_.remote_dir, base, dir_entry.path()),
                              regular ? Entry::Kind::REGULAR : Entry::Kind::SPECIAL, ""});
    }
    if (ec) {
      unreadable(dir, ec);
      ec.clear();
    }
  }

  if (entries.empty()) {
    throw TransferError(ErrorKind::LOCAL_IO, root.string() + " contains no files");
  }

  std::sort(entries.begin(), entries.end(),
            [](const Entry& a, const Entry& b) { return a.local_path < b.local_path; });
  return entries;
}

bool DirectoryOrchestrator::preflight(const std::vector<Entry>& entries, TransferReport& report) {
  std::vector<std::string> paths;
  for (const Entry& entry : entries) {
    if (entry.kind == Entry::Kind::REGULAR) {
      paths.push_back(entry.remote_path);
    }
  }
  if (paths.empty()) {
    return true;
  }

  try {
    auto verdict = session_.check_paths(paths, options_.overwrite);
    if (!verdict.first) {
      report.aborted = true;
      report.abort_reason = "pre-flight refused: " + verdict.second;
    }
  } catch (const session::SessionError& e) {
    report.aborted = true;
    report.abort_reason = std::string("pre-flight failed: ") + e.what();
  }

  if (report.aborted) {
    BOOST_LOG_TRIVIAL(error) << "Directory orchestrator: " << report.abort_reason;
    return false;
  }
  BOOST_LOG_TRIVIAL(debug) << "Directory orchestrator: Pre-flight approved " << paths.size() << " path(s)";
  return true;
}

} // namespace transfer
} // namespace fstore
