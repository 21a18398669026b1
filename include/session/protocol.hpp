#ifndef FSTORE_SESSION_PROTOCOL_HPP
#define FSTORE_SESSION_PROTOCOL_HPP

#include <string>
#include <utility>
#include <vector>
#include "session/message_frame.hpp"
#include "session/payload.hpp"
#include "session/session.hpp"
#include "session/session_error.hpp"

namespace fstore {
namespace session {
namespace protocol {

// Payload layouts of every request and response. Shared by the client
// session and by anything that answers it.

struct HelloRequest {
  std::string service_name;
  std::string key_hash;
};

struct OpenWriteRequest {
  std::string path;
  uint64_t size{0};
  std::string hash;
  bool overwrite{false};
};

struct BlockRequest {
  uint64_t key{0};
  transfer::BlockSpec block;
};

struct WriteBlockRequest {
  uint64_t key{0};
  transfer::BlockSpec block;
  std::vector<uint8_t> data;
};

struct CheckPathsRequest {
  std::vector<std::string> paths;
  bool overwrite{false};
};

// ---- REQUEST ENCODING ----
std::vector<uint8_t> encode(const HelloRequest& request);
std::vector<uint8_t> encode(const OpenWriteRequest& request);
std::vector<uint8_t> encode(const BlockRequest& request);
std::vector<uint8_t> encode(const WriteBlockRequest& request);
std::vector<uint8_t> encode(const CheckPathsRequest& request);
// Requests whose only field is a key or a path
std::vector<uint8_t> encode_key(uint64_t key);
std::vector<uint8_t> encode_path(const std::string& path);

HelloRequest decode_hello(const std::vector<uint8_t>& payload);
OpenWriteRequest decode_open_write(const std::vector<uint8_t>& payload);
BlockRequest decode_block_request(const std::vector<uint8_t>& payload);
WriteBlockRequest decode_write_block(const std::vector<uint8_t>& payload);
CheckPathsRequest decode_check_paths(const std::vector<uint8_t>& payload);
uint64_t decode_key(const std::vector<uint8_t>& payload);
std::string decode_path(const std::vector<uint8_t>& payload);


// ---- RESPONSE ENCODING ----
std::vector<uint8_t> encode_error(RemoteStatus status, const std::string& message);
std::vector<uint8_t> encode_u64(uint64_t value);
std::vector<uint8_t> encode(const WriteAck& ack);
std::vector<uint8_t> encode(const ReadGrant& grant);
std::vector<uint8_t> encode(const BlockData& data);
std::vector<uint8_t> encode(const RemoteFileInfo& info);
std::vector<uint8_t> encode(const std::vector<RemoteFileInfo>& entries);
std::vector<uint8_t> encode_check_result(bool ok, const std::string& message);

// Throws the SessionError carried by a RESPONSE_ERROR frame, or a PROTOCOL
// error for anything that is not RESPONSE_OK
void expect_ok(const MessageFrame& response);

uint64_t decode_u64(const std::vector<uint8_t>& payload);
WriteAck decode_write_ack(const std::vector<uint8_t>& payload);
ReadGrant decode_read_grant(const std::vector<uint8_t>& payload);
BlockData decode_block_data(const std::vector<uint8_t>& payload);
RemoteFileInfo decode_file_info(const std::vector<uint8_t>& payload);
std::vector<RemoteFileInfo> decode_listing(const std::vector<uint8_t>& payload);
std::pair<bool, std::string> decode_check_result(const std::vector<uint8_t>& payload);

} // namespace protocol
} // namespace session
} // namespace fstore

#endif // FSTORE_SESSION_PROTOCOL_HPP
