#include "session/payload.hpp"
#include "session/session_error.hpp"
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <limits>

namespace fstore {
namespace session {

//==============================================
// PAYLOAD WRITER
//==============================================

PayloadWriter& PayloadWriter::put_u8(uint8_t value) {
  buffer_.push_back(value);
  return *this;
}

PayloadWriter& PayloadWriter::put_bool(bool value) {
  return put_u8(value ? 1 : 0);
}

PayloadWriter& PayloadWriter::put_u32(uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  write_bytes(&network_value, sizeof(network_value));
  return *this;
}

PayloadWriter& PayloadWriter::put_u64(uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  write_bytes(&network_value, sizeof(network_value));
  return *this;
}

PayloadWriter& PayloadWriter::put_i64(int64_t value) {
  return put_u64(static_cast<uint64_t>(value));
}

PayloadWriter& PayloadWriter::put_string(const std::string& value) {
  return put_blob(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

PayloadWriter& PayloadWriter::put_blob(const std::vector<uint8_t>& value) {
  return put_blob(value.data(), value.size());
}

PayloadWriter& PayloadWriter::put_blob(const uint8_t* data, std::size_t size) {
  if (size > std::numeric_limits<uint32_t>::max()) {
    throw SessionError(SessionErrorCode::PROTOCOL, "field too large: " + std::to_string(size) + " bytes");
  }
  put_u32(static_cast<uint32_t>(size));
  write_bytes(data, size);
  return *this;
}

void PayloadWriter::write_bytes(const void* data, std::size_t size) {
  const auto* bytes = static_cast<const uint8_t*>(data);
  buffer_.insert(buffer_.end(), bytes, bytes + size);
}

//==============================================
// PAYLOAD READER
//==============================================

PayloadReader::PayloadReader(const std::vector<uint8_t>& data)
  : data_(data)
  , pos_(0) {}

uint8_t PayloadReader::get_u8() {
  uint8_t value = 0;
  read_bytes(&value, sizeof(value));
  return value;
}

bool PayloadReader::get_bool() {
  return get_u8() != 0;
}

uint32_t PayloadReader::get_u32() {
  uint32_t network_value = 0;
  read_bytes(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

uint64_t PayloadReader::get_u64() {
  uint64_t network_value = 0;
  read_bytes(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

int64_t PayloadReader::get_i64() {
  return static_cast<int64_t>(get_u64());
}

std::string PayloadReader::get_string() {
  uint32_t size = get_u32();
  require(size);
  std::string value(size, '\0');
  read_bytes(value.data(), size);
  return value;
}

std::vector<uint8_t> PayloadReader::get_blob() {
  uint32_t size = get_u32();
  require(size);
  std::vector<uint8_t> value(size);
  read_bytes(value.data(), size);
  return value;
}

void PayloadReader::expect_end() const {
  if (!at_end()) {
    throw SessionError(SessionErrorCode::PROTOCOL,
                       std::to_string(data_.size() - pos_) + " unexpected trailing bytes in payload");
  }
}

void PayloadReader::require(std::size_t size) const {
  if (size > data_.size() - pos_) {
    throw SessionError(SessionErrorCode::PROTOCOL,
                       "truncated payload: need " + std::to_string(size) + " bytes, have " +
                       std::to_string(data_.size() - pos_));
  }
}

void PayloadReader::read_bytes(void* out, std::size_t size) {
  require(size);
  if (size > 0) {
    std::memcpy(out, data_.data() + pos_, size);
  }
  pos_ += size;
}

} // namespace session
} // namespace fstore
