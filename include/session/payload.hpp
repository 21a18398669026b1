#ifndef FSTORE_SESSION_PAYLOAD_HPP
#define FSTORE_SESSION_PAYLOAD_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace fstore {
namespace session {

// Appends big-endian fields to a frame payload.
// Strings and blobs are written as u32 length followed by the bytes.
class PayloadWriter {
public:
  PayloadWriter& put_u8(uint8_t value);
  PayloadWriter& put_bool(bool value);
  PayloadWriter& put_u32(uint32_t value);
  PayloadWriter& put_u64(uint64_t value);
  PayloadWriter& put_i64(int64_t value);
  PayloadWriter& put_string(const std::string& value);
  PayloadWriter& put_blob(const std::vector<uint8_t>& value);
  PayloadWriter& put_blob(const uint8_t* data, std::size_t size);

  const std::vector<uint8_t>& bytes() const { return buffer_; }
  std::vector<uint8_t> take() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;

  void write_bytes(const void* data, std::size_t size);
};

// Reads fields written by PayloadWriter. Any truncation throws
// SessionError(PROTOCOL).
class PayloadReader {
public:
  explicit PayloadReader(const std::vector<uint8_t>& data);

  uint8_t get_u8();
  bool get_bool();
  uint32_t get_u32();
  uint64_t get_u64();
  int64_t get_i64();
  std::string get_string();
  std::vector<uint8_t> get_blob();

  bool at_end() const { return pos_ == data_.size(); }
  // Throws if unread bytes remain
  void expect_end() const;

private:
  const std::vector<uint8_t>& data_;
  std::size_t pos_;

  void require(std::size_t size) const;
  void read_bytes(void* out, std::size_t size);
};

} // namespace session
} // namespace fstore

#endif // FSTORE_SESSION_PAYLOAD_HPP
