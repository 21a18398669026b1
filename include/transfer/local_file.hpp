#ifndef FSTORE_TRANSFER_LOCAL_FILE_HPP
#define FSTORE_TRANSFER_LOCAL_FILE_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>
#include "transfer/block_codec.hpp"

namespace fstore {
namespace transfer {

// Block reads from a local source file. Errors throw TransferError(LOCAL_IO).
class LocalFileReader {
public:
  explicit LocalFileReader(const std::filesystem::path& path);

  uint64_t size() const { return size_; }
  // Fails if the file ends before the block does
  std::vector<uint8_t> read(const BlockSpec& block);

private:
  std::filesystem::path path_;
  std::ifstream file_;
  uint64_t size_;
};

// Destination of a pull. The file is created (or truncated) and sized to
// total_size on open so blocks can be written at any offset in any order.
class LocalFileWriter {
public:
  LocalFileWriter(const std::filesystem::path& path, uint64_t total_size);

  LocalFileWriter(const LocalFileWriter&) = delete;
  LocalFileWriter& operator=(const LocalFileWriter&) = delete;

  // Writes and flushes; the range is durable once this returns
  void write_at(uint64_t offset, const std::vector<uint8_t>& data);
  void close();
  // Closes and deletes the file
  void discard() noexcept;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::fstream file_;
  uint64_t total_size_;
};

} // namespace transfer
} // namespace fstore

#endif // FSTORE_TRANSFER_LOCAL_FILE_HPP
