#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <boost/log/trivial.hpp>
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "session/tcp_session.hpp"
#include "transfer/cancel_token.hpp"

namespace {

fstore::transfer::CancelToken g_cancel;

void handle_signal(int /*signal*/) {
  g_cancel.cancel();
}

std::filesystem::path executable_dir(const char* argv0) {
  std::error_code ec;
  std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    self = std::filesystem::absolute(argv0, ec);
  }
  return ec ? std::filesystem::path() : self.parent_path();
}

int run_command(const fstore::cli::CommandLine& command, const std::filesystem::path& exe_dir) {
  fstore::config::ClientConfig config =
      fstore::config::load_config_file(fstore::config::locate_config(exe_dir));
  fstore::logging::init_logging(config.log_file, config.log_level);
  BOOST_LOG_TRIVIAL(info) << "Main: fstore starting";

  fstore::session::TcpSession session(config.session_options());
  session.connect();

  fstore::cli::CLI cli(session, config, g_cancel);
  int exit_code = cli.execute(command);

  session.disconnect();
  BOOST_LOG_TRIVIAL(info) << "Main: fstore finished with exit code " << exit_code;
  return exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  fstore::cli::CommandLine command;
  try {
    command = fstore::cli::parse_command_line(args);
  } catch (const fstore::cli::UsageError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    fstore::cli::print_usage(std::cerr, argv[0]);
    return 1;
  }

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  try {
    if (command.command == fstore::cli::Command::CREATE) {
      fstore::config::write_default_config("config");
      std::cout << "Wrote ./config\n";
      return 0;
    }
    return run_command(command, executable_dir(argv[0]));
  } catch (const fstore::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  } catch (const fstore::session::SessionError& e) {
    std::cerr << "Error: cannot reach the file store: " << e.what() << '\n';
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
