#ifndef FSTORE_TRANSFER_REMOTE_PATH_HPP
#define FSTORE_TRANSFER_REMOTE_PATH_HPP

#include <filesystem>
#include <string>

namespace fstore {
namespace transfer {

// Remote paths always use '/' separators
std::string normalize_remote(const std::string& path);

// "<dir>/<file name>", or the bare file name when dir is empty
std::string remote_file_path(const std::string& remote_dir, const std::filesystem::path& local_file);

// "<dir>/<root name>/<file relative to root>"
std::string image_remote_path(const std::string& remote_dir, const std::filesystem::path& root,
                              const std::filesystem::path& file);

// Where a pulled file lands: inside save when it is a directory, at save
// otherwise, and in the working directory under the remote name when save
// is empty
std::filesystem::path local_save_path(const std::filesystem::path& save, const std::string& remote_path);

} // namespace transfer
} // namespace fstore

#endif // FSTORE_TRANSFER_REMOTE_PATH_HPP
