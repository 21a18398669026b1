#ifndef FSTORE_CLI_CLI_HPP
#define FSTORE_CLI_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "session/session.hpp"
#include "transfer/cancel_token.hpp"
#include "transfer/transfer_types.hpp"

namespace fstore {
namespace cli {

enum class Command {
  CREATE,
  PUSH,
  PULL,
  IMAGE_PUSH,
  SHOW,
  INFO
};

struct CommandLine {
  Command command{Command::CREATE};
  // File, remote file, image root or remote directory depending on command
  std::string target;
  std::string dir;
  std::filesystem::path save;
  bool async{false};
  bool overwrite{false};
  bool preflight{true};
  std::optional<uint32_t> block_size;
  std::optional<std::size_t> window;
};

class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// args excludes the program name. Throws UsageError.
CommandLine parse_command_line(const std::vector<std::string>& args);
void print_usage(std::ostream& out, const std::string& program_name);

// Runs the commands that talk to the file store
class CLI {
public:
  // ---- CONSTRUCTOR ----
  CLI(session::Session& session, const config::ClientConfig& config,
      const transfer::CancelToken& cancel, std::ostream& out = std::cout);


  // ---- COMMAND PROCESSING ----
  // Returns the process exit code
  int execute(const CommandLine& command);

private:
  // ---- PARAMETERS ----
  session::Session& session_;
  const config::ClientConfig& config_;
  const transfer::CancelToken& cancel_;
  std::ostream& out_;


  // ---- COMMAND HANDLERS ----
  int handle_push(const CommandLine& command);
  int handle_pull(const CommandLine& command);
  int handle_image_push(const CommandLine& command);
  int handle_show(const CommandLine& command);
  int handle_info(const CommandLine& command);


  // ---- OUTPUT ----
  void render_progress(const std::string& label, uint64_t done, uint64_t total);
  int report_result(const transfer::FileResult& result);
  void log_and_display_error(const std::string& message, const std::string& error);
};

// "1.50 MB" style sizes
std::string format_size(uint64_t bytes);
// Local time as dd/mm/YYYY HH:MM:SS
std::string format_time(int64_t seconds);

} // namespace cli
} // namespace fstore

#endif // FSTORE_CLI_CLI_HPP
