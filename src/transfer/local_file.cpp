#include "transfer/local_file.hpp"
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace fstore {
namespace transfer {

//==============================================
// READER
//==============================================

LocalFileReader::LocalFileReader(const std::filesystem::path& path)
  : path_(path)
  , size_(0) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    throw TransferError(ErrorKind::LOCAL_IO, "not a regular file: " + path_.string());
  }
  size_ = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw TransferError(ErrorKind::LOCAL_IO, "cannot stat " + path_.string() + ": " + ec.message());
  }

  file_.open(path_, std::ios::binary);
  if (!file_) {
    throw TransferError(ErrorKind::LOCAL_IO, "cannot open " + path_.string());
  }
}

std::vector<uint8_t> LocalFileReader::read(const BlockSpec& block) {
  std::vector<uint8_t> data(block.length);
  file_.seekg(static_cast<std::streamoff>(block.offset));
  file_.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(block.length));
  if (static_cast<uint64_t>(file_.gcount()) != block.length) {
    throw TransferError(ErrorKind::LOCAL_IO, "short read of block " + std::to_string(block.index) +
                        " from " + path_.string());
  }
  return data;
}

//==============================================
// WRITER
//==============================================

LocalFileWriter::LocalFileWriter(const std::filesystem::path& path, uint64_t total_size)
  : path_(path)
  , total_size_(total_size) {
  {
    std::ofstream create(path_, std::ios::binary | std::ios::trunc);
    if (!create) {
      throw TransferError(ErrorKind::LOCAL_IO, "cannot create " + path_.string());
    }
  }

  std::error_code ec;
  std::filesystem::resize_file(path_, total_size_, ec);
  if (ec) {
    throw TransferError(ErrorKind::LOCAL_IO, "cannot size " + path_.string() + ": " + ec.message());
  }

  file_.open(path_, std::ios::binary | std::ios::in | std::ios::out);
  if (!file_) {
    throw TransferError(ErrorKind::LOCAL_IO, "cannot open " + path_.string() + " for writing");
  }
  BOOST_LOG_TRIVIAL(debug) << "Local file: Prepared " << path_ << " (" << total_size_ << " bytes)";
}

void LocalFileWriter::write_at(uint64_t offset, const std::vector<uint8_t>& data) {
  if (offset + data.size() > total_size_) {
    throw TransferError(ErrorKind::SHORT_TRANSFER, "block at offset " + std::to_string(offset) +
                        " runs past the end of " + path_.string());
  }

  file_.seekp(static_cast<std::streamoff>(offset));
  file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  file_.flush();
  if (!file_) {
    throw TransferError(ErrorKind::LOCAL_IO, "write failed at offset " + std::to_string(offset) +
                        " in " + path_.string());
  }
}

void LocalFileWriter::close() {
  if (file_.is_open()) {
    file_.close();
    if (file_.fail()) {
      throw TransferError(ErrorKind::LOCAL_IO, "cannot close " + path_.string());
    }
  }
}

void LocalFileWriter::discard() noexcept {
  if (file_.is_open()) {
    file_.close();
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Local file: Could not remove " << path_ << ": " << ec.message();
  } else {
    BOOST_LOG_TRIVIAL(info) << "Local file: Removed " << path_;
  }
}

} // namespace transfer
} // namespace fstore
