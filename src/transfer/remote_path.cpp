#include "transfer/remote_path.hpp"
#include <algorithm>
#include <system_error>

namespace fstore {
namespace transfer {

namespace {

std::string join(const std::string& dir, const std::string& tail) {
  std::string base = normalize_remote(dir);
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base.empty() ? tail : base + "/" + tail;
}

std::string last_component(const std::string& remote_path) {
  std::string path = normalize_remote(remote_path);
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  auto slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

std::string normalize_remote(const std::string& path) {
  std::string normalized = path;
  std::replace(normalized.begin(), normalized.end(), '\\', '/');
  return normalized;
}

std::string remote_file_path(const std::string& remote_dir, const std::filesystem::path& local_file) {
  return join(remote_dir, local_file.filename().string());
}

std::string image_remote_path(const std::string& remote_dir, const std::filesystem::path& root,
                              const std::filesystem::path& file) {
  std::filesystem::path base = root.lexically_normal();
  if (base.filename().empty()) {
    base = base.parent_path();
  }
  std::string relative = file.lexically_normal().lexically_relative(base).generic_string();
  return join(remote_dir, normalize_remote(base.filename().string() + "/" + relative));
}

std::filesystem::path local_save_path(const std::filesystem::path& save, const std::string& remote_path) {
  std::string name = last_component(remote_path);
  if (save.empty()) {
    return std::filesystem::path(name);
  }
  std::error_code ec;
  if (std::filesystem::is_directory(save, ec)) {
    return save / name;
  }
  return save;
}

} // namespace transfer
} // namespace fstore
