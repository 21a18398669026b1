#ifndef FSTORE_SESSION_FRAME_CODEC_HPP
#define FSTORE_SESSION_FRAME_CODEC_HPP

#include <array>
#include <cstdint>
#include <vector>
#include "session/message_frame.hpp"

namespace fstore {
namespace session {

// Wire layout (all integers big-endian):
//   u32 body_length | u8 message_type | u64 request_id | u8 flags | payload
// With a session key the payload is IV (16 bytes) followed by the
// AES-256-CBC ciphertext and flags bit 0 is set.
class FrameCodec {
public:
  static constexpr std::size_t LENGTH_PREFIX_SIZE = sizeof(uint32_t);
  static constexpr std::size_t BODY_HEADER_SIZE = sizeof(uint8_t) + sizeof(uint64_t) + sizeof(uint8_t);
  static constexpr uint32_t MAX_FRAME_SIZE = 64 * 1024 * 1024;
  static constexpr uint8_t FLAG_ENCRYPTED = 0x01;

  // ---- CONSTRUCTOR ----
  // An empty key disables payload encryption
  explicit FrameCodec(const std::vector<uint8_t>& key = {});

  bool is_encrypted() const { return !key_.empty(); }


  // ---- ENCODING AND DECODING ----
  // Complete frame, length prefix included, ready for a socket write
  std::vector<uint8_t> encode(const MessageFrame& frame) const;

  // Split decoding used by the socket reader: the length prefix first,
  // then the body of that many bytes
  static uint32_t decode_length(const std::array<uint8_t, LENGTH_PREFIX_SIZE>& prefix);
  MessageFrame decode_body(const std::vector<uint8_t>& body) const;

private:
  std::vector<uint8_t> key_;

  std::vector<uint8_t> seal(const std::vector<uint8_t>& plain) const;
  std::vector<uint8_t> unseal(const uint8_t* sealed, std::size_t size) const;
};

} // namespace session
} // namespace fstore

#endif // FSTORE_SESSION_FRAME_CODEC_HPP
