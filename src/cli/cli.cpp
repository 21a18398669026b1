#include "cli/cli.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <boost/log/trivial.hpp>
#include "session/session_error.hpp"
#include "transfer/directory_orchestrator.hpp"
#include "transfer/pull_engine.hpp"
#include "transfer/push_engine.hpp"
#include "transfer/remote_path.hpp"

namespace fstore {
namespace cli {

//==============================================
// ARGUMENT PARSING
//==============================================

namespace {

// Flag -> whether it takes a value
const std::unordered_map<std::string, bool> FLAG_MAP = {
  {"--dir", true},
  {"--save", true},
  {"--block", true},
  {"--window", true},
  {"--async", false},
  {"--overwrite", false},
  {"--no-check", false}
};

uint64_t parse_number(const std::string& flag, const std::string& value, uint64_t max) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 12) {
    throw UsageError("Invalid value for " + flag + ": " + value);
  }
  uint64_t number = std::stoull(value);
  if (number == 0 || number > max) {
    throw UsageError(flag + " must be between 1 and " + std::to_string(max));
  }
  return number;
}

} // namespace

CommandLine parse_command_line(const std::vector<std::string>& args) {
  if (args.empty()) {
    throw UsageError("No command given");
  }

  CommandLine command;
  std::size_t next = 1;
  std::unordered_set<std::string> allowed;

  const std::string& name = args[0];
  if (name == "create") {
    command.command = Command::CREATE;
  } else if (name == "push") {
    command.command = Command::PUSH;
    allowed = {"--dir", "--async", "--block", "--overwrite"};
  } else if (name == "pull") {
    command.command = Command::PULL;
    allowed = {"--save", "--async", "--block", "--overwrite", "--window"};
  } else if (name == "image") {
    if (args.size() < 2 || args[1] != "push") {
      throw UsageError("Usage: image push <path>");
    }
    command.command = Command::IMAGE_PUSH;
    allowed = {"--dir", "--block", "--overwrite", "--no-check"};
    next = 2;
  } else if (name == "show") {
    command.command = Command::SHOW;
  } else if (name == "info") {
    command.command = Command::INFO;
  } else {
    throw UsageError("Unknown command: " + name);
  }

  for (std::size_t i = next; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg.rfind("--", 0) != 0) {
      if (command.command == Command::CREATE || !command.target.empty()) {
        throw UsageError("Unexpected argument: " + arg);
      }
      command.target = arg;
      continue;
    }

    auto flag = FLAG_MAP.find(arg);
    if (flag == FLAG_MAP.end() || allowed.count(arg) == 0) {
      throw UsageError("Unknown argument for " + name + ": " + arg);
    }

    std::string value;
    if (flag->second) {
      if (i + 1 >= args.size()) {
        throw UsageError(arg + " needs a value");
      }
      value = args[++i];
    }

    if (arg == "--dir") {
      command.dir = value;
    } else if (arg == "--save") {
      command.save = value;
    } else if (arg == "--block") {
      command.block_size = static_cast<uint32_t>(parse_number(arg, value, 32 * 1024 * 1024));
    } else if (arg == "--window") {
      command.window = static_cast<std::size_t>(parse_number(arg, value, 1024));
    } else if (arg == "--async") {
      command.async = true;
    } else if (arg == "--overwrite") {
      command.overwrite = true;
    } else if (arg == "--no-check") {
      command.preflight = false;
    }
  }

  if (command.command != Command::CREATE && command.target.empty()) {
    throw UsageError(name + " needs a path");
  }
  return command;
}

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " <command> [options]\n"
      << "Commands:\n"
      << "  create                                   Write a default ./config\n"
      << "  push <file> [--dir D] [--async] [--block N] [--overwrite]\n"
      << "                                           Upload one file\n"
      << "  pull <remote-file> [--save P] [--async] [--block N] [--overwrite] [--window N]\n"
      << "                                           Download one file\n"
      << "  image push <path> [--dir D] [--block N] [--overwrite] [--no-check]\n"
      << "                                           Upload a directory tree\n"
      << "  show <remote-dir>                        List a remote directory\n"
      << "  info <remote-file>                       Show remote file details\n";
}

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(session::Session& session, const config::ClientConfig& config,
         const transfer::CancelToken& cancel, std::ostream& out)
  : session_(session)
  , config_(config)
  , cancel_(cancel)
  , out_(out) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Initialized";
}

//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::execute(const CommandLine& command) {
  try {
    switch (command.command) {
      case Command::PUSH:       return handle_push(command);
      case Command::PULL:       return handle_pull(command);
      case Command::IMAGE_PUSH: return handle_image_push(command);
      case Command::SHOW:       return handle_show(command);
      case Command::INFO:       return handle_info(command);
      case Command::CREATE:     break;
    }
  } catch (const session::SessionError& e) {
    log_and_display_error("Request failed", e.what());
    return 1;
  } catch (const transfer::TransferError& e) {
    log_and_display_error(transfer::error_kind_to_string(e.kind()), e.what());
    return 1;
  }

  log_and_display_error("Invalid command", "create does not use a session");
  return 1;
}

int CLI::handle_push(const CommandLine& command) {
  if (command.async) {
    BOOST_LOG_TRIVIAL(info) << "CLI: --async has no effect on push, blocks are sent sequentially";
  }

  transfer::TransferDescriptor descriptor;
  descriptor.local_path = command.target;
  descriptor.remote_path = transfer::remote_file_path(command.dir, descriptor.local_path);
  descriptor.block_size = command.block_size.value_or(config_.block_size);
  descriptor.overwrite = command.overwrite;
  descriptor.mode = transfer::TransferMode::SYNC;

  const std::string label = descriptor.remote_path;
  transfer::PushEngine engine(session_, descriptor,
    [this, label](uint64_t done, uint64_t total) { render_progress(label, done, total); }, &cancel_);
  return report_result(engine.run());
}

int CLI::handle_pull(const CommandLine& command) {
  transfer::TransferDescriptor descriptor;
  descriptor.remote_path = transfer::normalize_remote(command.target);
  descriptor.local_path = transfer::local_save_path(command.save, descriptor.remote_path);
  descriptor.block_size = command.block_size.value_or(config_.block_size);
  descriptor.overwrite = command.overwrite;
  descriptor.mode = command.async ? transfer::TransferMode::ASYNC : transfer::TransferMode::SYNC;
  descriptor.max_concurrency = command.window.value_or(config_.max_concurrency);

  const std::string label = descriptor.local_path.string();
  transfer::PullEngine engine(session_, descriptor,
    [this, label](uint64_t done, uint64_t total) { render_progress(label, done, total); }, &cancel_);
  return report_result(engine.run());
}

int CLI::handle_image_push(const CommandLine& command) {
  transfer::ImageOptions options;
  options.remote_dir = command.dir;
  options.block_size = command.block_size.value_or(config_.block_size);
  options.overwrite = command.overwrite;
  options.preflight = command.preflight;

  transfer::DirectoryOrchestrator orchestrator(session_, options, &cancel_);
  orchestrator.set_progress([this](const std::string& remote, uint64_t done, uint64_t total) {
    render_progress(remote, done, total);
  });

  transfer::TransferReport report = orchestrator.push_tree(command.target);

  for (const auto& result : report.results) {
    if (result.outcome == transfer::Outcome::SKIPPED) {
      out_ << "Skipped " << result.path << ": " << result.reason << "\n";
    } else if (result.outcome == transfer::Outcome::FAILED) {
      out_ << "Failed  " << result.path << " [" << transfer::error_kind_to_string(result.error) << "] "
           << result.reason << "\n";
    }
  }

  out_ << report.count(transfer::Outcome::SUCCESS) << " pushed, "
       << report.count(transfer::Outcome::SKIPPED) << " skipped, "
       << report.count(transfer::Outcome::FAILED) << " failed\n";
  if (report.aborted) {
    out_ << "Aborted: " << report.abort_reason << "\n";
  }
  return report.succeeded() ? 0 : 1;
}

int CLI::handle_show(const CommandLine& command) {
  std::vector<session::RemoteFileInfo> entries =
      session_.list_directory(transfer::normalize_remote(command.target));

  std::stable_partition(entries.begin(), entries.end(),
                        [](const session::RemoteFileInfo& info) { return info.is_directory; });

  for (const auto& entry : entries) {
    out_ << std::setw(10) << (entry.is_directory ? format_size(0) : format_size(entry.size))
         << "   " << format_time(entry.create_time)
         << "   " << entry.name << (entry.is_directory ? "/" : "") << "\n";
  }
  return 0;
}

int CLI::handle_info(const CommandLine& command) {
  session::RemoteFileInfo info = session_.file_info(transfer::normalize_remote(command.target));

  out_ << "name:        " << info.name << "\n"
       << "size:        " << format_size(info.size) << " (" << info.size << " bytes)\n"
       << "sha256:      " << info.hash.value_or("-") << "\n"
       << "created:     " << format_time(info.create_time) << "\n"
       << "modifiable:  " << (info.can_modify ? "yes" : "no") << "\n";
  return 0;
}

//==============================================
// OUTPUT
//==============================================

void CLI::render_progress(const std::string& label, uint64_t done, uint64_t total) {
  constexpr int WIDTH = 30;
  int percent = total == 0 ? 100 : static_cast<int>(done * 100 / total);
  int filled = percent * WIDTH / 100;

  out_ << "\r" << label << " [" << std::string(filled, '#') << std::string(WIDTH - filled, ' ') << "] "
       << std::setw(3) << percent << "% " << format_size(done) << "/" << format_size(total) << std::flush;
  if (done >= total) {
    out_ << "\n";
  }
}

int CLI::report_result(const transfer::FileResult& result) {
  if (result.outcome == transfer::Outcome::FAILED) {
    out_ << "\nFailed " << result.path << " [" << transfer::error_kind_to_string(result.error) << "] "
         << result.reason << "\n";
    return 1;
  }
  out_ << "Done " << result.path << " (" << format_size(result.bytes) << ")\n";
  return 0;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

std::string format_size(uint64_t bytes) {
  static const char* const UNITS[] = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < sizeof(UNITS) / sizeof(UNITS[0])) {
    value /= 1024.0;
    ++unit;
  }

  std::ostringstream oss;
  if (unit == 0) {
    oss << bytes << " B";
  } else {
    oss << std::fixed << std::setprecision(2) << value << " " << UNITS[unit];
  }
  return oss.str();
}

std::string format_time(int64_t seconds) {
  std::time_t time = static_cast<std::time_t>(seconds);
  std::tm local{};
  if (localtime_r(&time, &local) == nullptr) {
    return "-";
  }
  std::ostringstream oss;
  oss << std::put_time(&local, "%d/%m/%Y %T");
  return oss.str();
}

} // namespace cli
} // namespace fstore
