#include "config/config.hpp"
#include <fstream>
#include <boost/program_options.hpp>
#include "crypto/crypto_stream.hpp"
#include "logger/logger.hpp"

namespace fstore {
namespace config {

namespace po = boost::program_options;

namespace {

const char* const CONFIG_FILE_NAME = "config";

po::options_description config_options() {
  po::options_description desc("fstore configuration");
  desc.add_options()
    ("server.addr", po::value<std::string>(), "host:port of the file store")
    ("server.service_name", po::value<std::string>()->default_value("filestore"), "service identity")
    ("server.verify_key", po::value<std::string>()->default_value(""), "verification key")
    ("server.request_timeout_ms", po::value<long long>()->default_value(5000), "per-request timeout")
    ("transfer.block_size", po::value<long long>()->default_value(65536), "block size in bytes")
    ("transfer.max_concurrency", po::value<long long>()->default_value(4), "async pull window")
    ("crypto.session_key", po::value<std::string>()->default_value(""), "AES-256 key, 64 hex characters")
    ("log.file", po::value<std::string>()->default_value("fstore.log"), "log file")
    ("log.level", po::value<std::string>()->default_value("info"), "minimum severity");
  return desc;
}

long long positive(const po::variables_map& vm, const char* key, long long max) {
  long long value = vm[key].as<long long>();
  if (value <= 0 || value > max) {
    throw ConfigError(std::string(key) + " must be between 1 and " + std::to_string(max));
  }
  return value;
}

void parse_addr(const std::string& addr, ClientConfig& config) {
  auto colon = addr.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == addr.size()) {
    throw ConfigError("server.addr must be host:port, got '" + addr + "'");
  }

  std::string port_text = addr.substr(colon + 1);
  if (port_text.find_first_not_of("0123456789") != std::string::npos || port_text.size() > 5) {
    throw ConfigError("server.addr has an invalid port '" + port_text + "'");
  }
  unsigned long port = std::stoul(port_text);
  if (port == 0 || port > 65535) {
    throw ConfigError("server.addr port out of range: " + port_text);
  }

  config.host = addr.substr(0, colon);
  config.port = static_cast<uint16_t>(port);
}

} // namespace

session::SessionOptions ClientConfig::session_options() const {
  session::SessionOptions options;
  options.host = host;
  options.port = port;
  options.service_name = service_name;
  options.verify_key = verify_key;
  options.request_timeout = request_timeout;
  options.session_key = session_key;
  return options;
}

ClientConfig parse_config(std::istream& input) {
  po::variables_map vm;
  try {
    po::store(po::parse_config_file(input, config_options()), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw ConfigError(e.what());
  }

  ClientConfig config;

  if (!vm.count("server.addr")) {
    throw ConfigError("server.addr is required");
  }
  parse_addr(vm["server.addr"].as<std::string>(), config);

  config.service_name = vm["server.service_name"].as<std::string>();
  config.verify_key = vm["server.verify_key"].as<std::string>();
  config.request_timeout = std::chrono::milliseconds(positive(vm, "server.request_timeout_ms", 3600000));
  config.block_size = static_cast<uint32_t>(positive(vm, "transfer.block_size", 32 * 1024 * 1024));
  config.max_concurrency = static_cast<std::size_t>(positive(vm, "transfer.max_concurrency", 1024));

  const std::string& key_hex = vm["crypto.session_key"].as<std::string>();
  if (!key_hex.empty()) {
    try {
      config.session_key = crypto::CryptoStream::key_from_hex(key_hex);
    } catch (const crypto::CryptoError& e) {
      throw ConfigError(std::string("crypto.session_key: ") + e.what());
    }
  }

  config.log_file = vm["log.file"].as<std::string>();
  try {
    config.log_level = logging::parse_severity(vm["log.level"].as<std::string>());
  } catch (const std::invalid_argument& e) {
    throw ConfigError(std::string("log.level: ") + e.what());
  }

  return config;
}

ClientConfig load_config_file(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigError("cannot open " + path.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Config: Loading " << path;
  return parse_config(file);
}

std::filesystem::path locate_config(const std::filesystem::path& executable_dir) {
  std::error_code ec;
  std::filesystem::path local = std::filesystem::current_path(ec) / CONFIG_FILE_NAME;
  if (!ec && std::filesystem::is_regular_file(local, ec)) {
    return local;
  }

  std::filesystem::path beside = executable_dir / CONFIG_FILE_NAME;
  if (!executable_dir.empty() && std::filesystem::is_regular_file(beside, ec)) {
    return beside;
  }

  throw ConfigError("no config file found in the working directory or in " + executable_dir.string() +
                    " (run 'fstore create' to write one)");
}

std::string default_config_text() {
  return
    "# fstore client configuration\n"
    "\n"
    "[server]\n"
    "# host:port of the file store\n"
    "addr = 127.0.0.1:6666\n"
    "service_name = filestore\n"
    "# only the SHA-256 of this key is sent\n"
    "verify_key = 123123\n"
    "request_timeout_ms = 5000\n"
    "\n"
    "[transfer]\n"
    "block_size = 65536\n"
    "# outstanding requests in an async pull\n"
    "max_concurrency = 4\n"
    "\n"
    "[crypto]\n"
    "# 64 hex characters enable AES-256 payload encryption\n"
    "# session_key =\n"
    "\n"
    "[log]\n"
    "file = fstore.log\n"
    "# trace, debug, info, warning, error or fatal\n"
    "level = info\n";
}

void write_default_config(const std::filesystem::path& path) {
  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    throw ConfigError("cannot write " + path.string());
  }
  file << default_config_text();
  if (!file) {
    throw ConfigError("failed writing " + path.string());
  }
  BOOST_LOG_TRIVIAL(info) << "Config: Wrote default configuration to " << path;
}

} // namespace config
} // namespace fstore
