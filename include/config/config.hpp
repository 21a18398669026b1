#ifndef FSTORE_CONFIG_CONFIG_HPP
#define FSTORE_CONFIG_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/log/trivial.hpp>
#include "session/tcp_session.hpp"

namespace fstore {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

struct ClientConfig {
  // server
  std::string host;
  uint16_t port{0};
  std::string service_name{"filestore"};
  std::string verify_key;
  std::chrono::milliseconds request_timeout{5000};

  // transfer
  uint32_t block_size{65536};
  std::size_t max_concurrency{4};

  // crypto
  std::vector<uint8_t> session_key;

  // log
  std::string log_file{"fstore.log"};
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};

  session::SessionOptions session_options() const;
};

// Parses INI text. Throws ConfigError naming the offending key.
ClientConfig parse_config(std::istream& input);
ClientConfig load_config_file(const std::filesystem::path& path);

// Looks for "config" in the working directory, then in executable_dir
std::filesystem::path locate_config(const std::filesystem::path& executable_dir);

std::string default_config_text();
// Overwrites any existing file
void write_default_config(const std::filesystem::path& path);

} // namespace config
} // namespace fstore

#endif // FSTORE_CONFIG_CONFIG_HPP
