#include "session/frame_codec.hpp"
#include "session/session_error.hpp"
#include "crypto/crypto_stream.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <cstring>
#include <sstream>

namespace fstore {
namespace session {

const char* message_type_to_string(MessageType type) {
  switch (type) {
    case MessageType::HELLO:          return "HELLO";
    case MessageType::OPEN_WRITE:     return "OPEN_WRITE";
    case MessageType::WRITE_BLOCK:    return "WRITE_BLOCK";
    case MessageType::FINISH_WRITE:   return "FINISH_WRITE";
    case MessageType::ABORT_WRITE:    return "ABORT_WRITE";
    case MessageType::OPEN_READ:      return "OPEN_READ";
    case MessageType::READ_BLOCK:     return "READ_BLOCK";
    case MessageType::CLOSE_READ:     return "CLOSE_READ";
    case MessageType::LIST_DIR:       return "LIST_DIR";
    case MessageType::FILE_INFO:      return "FILE_INFO";
    case MessageType::CHECK_PATHS:    return "CHECK_PATHS";
    case MessageType::RESPONSE_OK:    return "RESPONSE_OK";
    case MessageType::RESPONSE_ERROR: return "RESPONSE_ERROR";
    default:                          return "UNKNOWN";
  }
}

bool is_known_message_type(uint8_t raw) {
  return (raw >= static_cast<uint8_t>(MessageType::HELLO) &&
          raw <= static_cast<uint8_t>(MessageType::CHECK_PATHS)) ||
         raw == static_cast<uint8_t>(MessageType::RESPONSE_OK) ||
         raw == static_cast<uint8_t>(MessageType::RESPONSE_ERROR);
}

FrameCodec::FrameCodec(const std::vector<uint8_t>& key)
  : key_(key) {
  if (!key_.empty() && key_.size() != crypto::CryptoStream::KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Frame codec: Invalid session key size: " << key_.size();
    throw crypto::InitializationError("Frame codec: session key must be 32 bytes");
  }
}

//==============================================
// ENCODING
//==============================================

std::vector<uint8_t> FrameCodec::encode(const MessageFrame& frame) const {
  std::vector<uint8_t> payload = is_encrypted() ? seal(frame.payload) : frame.payload;

  std::size_t body_size = BODY_HEADER_SIZE + payload.size();
  if (body_size > MAX_FRAME_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Frame codec: Frame of " << body_size << " bytes exceeds limit";
    throw SessionError(SessionErrorCode::PROTOCOL, "frame exceeds maximum size");
  }

  std::vector<uint8_t> out(LENGTH_PREFIX_SIZE + body_size);
  uint8_t* cursor = out.data();

  uint32_t network_length = boost::endian::native_to_big(static_cast<uint32_t>(body_size));
  std::memcpy(cursor, &network_length, sizeof(network_length));
  cursor += sizeof(network_length);

  *cursor++ = static_cast<uint8_t>(frame.message_type);

  uint64_t network_request_id = boost::endian::native_to_big(frame.request_id);
  std::memcpy(cursor, &network_request_id, sizeof(network_request_id));
  cursor += sizeof(network_request_id);

  *cursor++ = is_encrypted() ? FLAG_ENCRYPTED : 0;

  if (!payload.empty()) {
    std::memcpy(cursor, payload.data(), payload.size());
  }

  BOOST_LOG_TRIVIAL(trace) << "Frame codec: Encoded " << message_type_to_string(frame.message_type)
                           << " #" << frame.request_id << " (" << out.size() << " bytes)";
  return out;
}

//==============================================
// DECODING
//==============================================

uint32_t FrameCodec::decode_length(const std::array<uint8_t, LENGTH_PREFIX_SIZE>& prefix) {
  uint32_t network_length = 0;
  std::memcpy(&network_length, prefix.data(), sizeof(network_length));
  uint32_t length = boost::endian::big_to_native(network_length);

  if (length < BODY_HEADER_SIZE || length > MAX_FRAME_SIZE) {
    throw SessionError(SessionErrorCode::PROTOCOL, "invalid frame length: " + std::to_string(length));
  }
  return length;
}

MessageFrame FrameCodec::decode_body(const std::vector<uint8_t>& body) const {
  if (body.size() < BODY_HEADER_SIZE) {
    throw SessionError(SessionErrorCode::PROTOCOL, "frame body too short");
  }

  const uint8_t* cursor = body.data();
  uint8_t raw_type = *cursor++;
  if (!is_known_message_type(raw_type)) {
    throw SessionError(SessionErrorCode::PROTOCOL, "unknown message type: " + std::to_string(raw_type));
  }

  MessageFrame frame;
  frame.message_type = static_cast<MessageType>(raw_type);

  uint64_t network_request_id = 0;
  std::memcpy(&network_request_id, cursor, sizeof(network_request_id));
  frame.request_id = boost::endian::big_to_native(network_request_id);
  cursor += sizeof(network_request_id);

  uint8_t flags = *cursor++;
  bool encrypted = (flags & FLAG_ENCRYPTED) != 0;
  if (encrypted != is_encrypted()) {
    // Both sides must agree on the session key
    throw SessionError(SessionErrorCode::PROTOCOL,
                       encrypted ? "encrypted frame received without a session key"
                                 : "plaintext frame received on an encrypted session");
  }

  std::size_t payload_size = body.size() - BODY_HEADER_SIZE;
  if (encrypted) {
    frame.payload = unseal(cursor, payload_size);
  } else {
    frame.payload.assign(cursor, cursor + payload_size);
  }

  BOOST_LOG_TRIVIAL(trace) << "Frame codec: Decoded " << message_type_to_string(frame.message_type)
                           << " #" << frame.request_id << " (" << frame.payload.size() << " payload bytes)";
  return frame;
}

//==============================================
// PAYLOAD ENCRYPTION
//==============================================

std::vector<uint8_t> FrameCodec::seal(const std::vector<uint8_t>& plain) const {
  auto iv = crypto::CryptoStream::generate_IV();

  crypto::CryptoStream cipher;
  cipher.initialize(key_, std::vector<uint8_t>(iv.begin(), iv.end()));

  std::stringstream plain_stream;
  plain_stream.write(reinterpret_cast<const char*>(plain.data()), static_cast<std::streamsize>(plain.size()));
  std::stringstream sealed_stream;
  cipher.encrypt(plain_stream, sealed_stream);

  const std::string sealed = sealed_stream.str();
  std::vector<uint8_t> out(iv.begin(), iv.end());
  out.insert(out.end(), sealed.begin(), sealed.end());
  return out;
}

std::vector<uint8_t> FrameCodec::unseal(const uint8_t* sealed, std::size_t size) const {
  constexpr std::size_t iv_size = crypto::CryptoStream::IV_SIZE;
  constexpr std::size_t block = crypto::CryptoStream::BLOCK_SIZE;
  if (size < iv_size + block || (size - iv_size) % block != 0) {
    throw SessionError(SessionErrorCode::PROTOCOL, "malformed encrypted payload of " + std::to_string(size) + " bytes");
  }

  crypto::CryptoStream cipher;
  cipher.initialize(key_, std::vector<uint8_t>(sealed, sealed + iv_size));

  std::stringstream sealed_stream;
  sealed_stream.write(reinterpret_cast<const char*>(sealed + iv_size), static_cast<std::streamsize>(size - iv_size));
  std::stringstream plain_stream;
  try {
    cipher.decrypt(sealed_stream, plain_stream);
  } catch (const crypto::CryptoError& e) {
    throw SessionError(SessionErrorCode::PROTOCOL, std::string("payload decryption failed: ") + e.what());
  }

  const std::string plain = plain_stream.str();
  return std::vector<uint8_t>(plain.begin(), plain.end());
}

} // namespace session
} // namespace fstore
