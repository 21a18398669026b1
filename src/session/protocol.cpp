#include "session/protocol.hpp"

namespace fstore {
namespace session {
namespace protocol {

namespace {

void put_block(PayloadWriter& writer, const transfer::BlockSpec& block) {
  writer.put_u64(block.index).put_u64(block.offset).put_u32(block.length);
}

transfer::BlockSpec get_block(PayloadReader& reader) {
  transfer::BlockSpec block;
  block.index = reader.get_u64();
  block.offset = reader.get_u64();
  block.length = reader.get_u32();
  return block;
}

void put_info(PayloadWriter& writer, const RemoteFileInfo& info) {
  writer.put_string(info.name)
        .put_u64(info.size)
        .put_bool(info.hash.has_value())
        .put_string(info.hash.value_or(""))
        .put_i64(info.create_time)
        .put_bool(info.is_directory)
        .put_bool(info.can_modify);
}

RemoteFileInfo get_info(PayloadReader& reader) {
  RemoteFileInfo info;
  info.name = reader.get_string();
  info.size = reader.get_u64();
  bool has_hash = reader.get_bool();
  std::string hash = reader.get_string();
  if (has_hash) {
    info.hash = hash;
  }
  info.create_time = reader.get_i64();
  info.is_directory = reader.get_bool();
  info.can_modify = reader.get_bool();
  return info;
}

} // namespace

//==============================================
// REQUESTS
//==============================================

std::vector<uint8_t> encode(const HelloRequest& request) {
  PayloadWriter writer;
  writer.put_string(request.service_name).put_string(request.key_hash);
  return writer.take();
}

std::vector<uint8_t> encode(const OpenWriteRequest& request) {
  PayloadWriter writer;
  writer.put_string(request.path)
        .put_u64(request.size)
        .put_string(request.hash)
        .put_bool(request.overwrite);
  return writer.take();
}

std::vector<uint8_t> encode(const BlockRequest& request) {
  PayloadWriter writer;
  writer.put_u64(request.key);
  put_block(writer, request.block);
  return writer.take();
}

std::vector<uint8_t> encode(const WriteBlockRequest& request) {
  PayloadWriter writer;
  writer.put_u64(request.key);
  put_block(writer, request.block);
  writer.put_blob(request.data);
  return writer.take();
}

std::vector<uint8_t> encode(const CheckPathsRequest& request) {
  PayloadWriter writer;
  writer.put_u32(static_cast<uint32_t>(request.paths.size()));
  for (const auto& path : request.paths) {
    writer.put_string(path);
  }
  writer.put_bool(request.overwrite);
  return writer.take();
}

std::vector<uint8_t> encode_key(uint64_t key) {
  return encode_u64(key);
}

std::vector<uint8_t> encode_path(const std::string& path) {
  PayloadWriter writer;
  writer.put_string(path);
  return writer.take();
}

HelloRequest decode_hello(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  HelloRequest request;
  request.service_name = reader.get_string();
  request.key_hash = reader.get_string();
  reader.expect_end();
  return request;
}

OpenWriteRequest decode_open_write(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  OpenWriteRequest request;
  request.path = reader.get_string();
  request.size = reader.get_u64();
  request.hash = reader.get_string();
  request.overwrite = reader.get_bool();
  reader.expect_end();
  return request;
}

BlockRequest decode_block_request(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  BlockRequest request;
  request.key = reader.get_u64();
  request.block = get_block(reader);
  reader.expect_end();
  return request;
}

WriteBlockRequest decode_write_block(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  WriteBlockRequest request;
  request.key = reader.get_u64();
  request.block = get_block(reader);
  request.data = reader.get_blob();
  reader.expect_end();
  return request;
}

CheckPathsRequest decode_check_paths(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  CheckPathsRequest request;
  uint32_t count = reader.get_u32();
  for (uint32_t i = 0; i < count; ++i) {
    request.paths.push_back(reader.get_string());
  }
  request.overwrite = reader.get_bool();
  reader.expect_end();
  return request;
}

uint64_t decode_key(const std::vector<uint8_t>& payload) {
  return decode_u64(payload);
}

std::string decode_path(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  std::string path = reader.get_string();
  reader.expect_end();
  return path;
}

//==============================================
// RESPONSES
//==============================================

std::vector<uint8_t> encode_error(RemoteStatus status, const std::string& message) {
  PayloadWriter writer;
  writer.put_u8(static_cast<uint8_t>(status)).put_string(message);
  return writer.take();
}

std::vector<uint8_t> encode_u64(uint64_t value) {
  PayloadWriter writer;
  writer.put_u64(value);
  return writer.take();
}

std::vector<uint8_t> encode(const WriteAck& ack) {
  PayloadWriter writer;
  writer.put_u64(ack.index).put_u32(ack.length);
  return writer.take();
}

std::vector<uint8_t> encode(const ReadGrant& grant) {
  PayloadWriter writer;
  writer.put_u64(grant.key);
  put_info(writer, grant.info);
  return writer.take();
}

std::vector<uint8_t> encode(const BlockData& data) {
  PayloadWriter writer;
  writer.put_u64(data.index).put_u64(data.offset).put_blob(data.bytes);
  return writer.take();
}

std::vector<uint8_t> encode(const RemoteFileInfo& info) {
  PayloadWriter writer;
  put_info(writer, info);
  return writer.take();
}

std::vector<uint8_t> encode(const std::vector<RemoteFileInfo>& entries) {
  PayloadWriter writer;
  writer.put_u32(static_cast<uint32_t>(entries.size()));
  for (const auto& entry : entries) {
    put_info(writer, entry);
  }
  return writer.take();
}

std::vector<uint8_t> encode_check_result(bool ok, const std::string& message) {
  PayloadWriter writer;
  writer.put_bool(ok).put_string(message);
  return writer.take();
}

void expect_ok(const MessageFrame& response) {
  if (response.message_type == MessageType::RESPONSE_OK) {
    return;
  }

  if (response.message_type == MessageType::RESPONSE_ERROR) {
    PayloadReader reader(response.payload);
    uint8_t raw_status = reader.get_u8();
    std::string message = reader.get_string();
    if (raw_status == static_cast<uint8_t>(RemoteStatus::OK) ||
        raw_status > static_cast<uint8_t>(RemoteStatus::INVALID)) {
      throw SessionError(SessionErrorCode::PROTOCOL, "bad error status " + std::to_string(raw_status) + ": " + message);
    }
    throw SessionError(static_cast<RemoteStatus>(raw_status), message);
  }

  throw SessionError(SessionErrorCode::PROTOCOL,
                     std::string("unexpected response type ") + message_type_to_string(response.message_type));
}

uint64_t decode_u64(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  uint64_t value = reader.get_u64();
  reader.expect_end();
  return value;
}

WriteAck decode_write_ack(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  WriteAck ack;
  ack.index = reader.get_u64();
  ack.length = reader.get_u32();
  reader.expect_end();
  return ack;
}

ReadGrant decode_read_grant(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  ReadGrant grant;
  grant.key = reader.get_u64();
  grant.info = get_info(reader);
  reader.expect_end();
  return grant;
}

BlockData decode_block_data(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  BlockData data;
  data.index = reader.get_u64();
  data.offset = reader.get_u64();
  data.bytes = reader.get_blob();
  reader.expect_end();
  return data;
}

RemoteFileInfo decode_file_info(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  RemoteFileInfo info = get_info(reader);
  reader.expect_end();
  return info;
}

std::vector<RemoteFileInfo> decode_listing(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  uint32_t count = reader.get_u32();
  std::vector<RemoteFileInfo> entries;
  for (uint32_t i = 0; i < count; ++i) {
    entries.push_back(get_info(reader));
  }
  reader.expect_end();
  return entries;
}

std::pair<bool, std::string> decode_check_result(const std::vector<uint8_t>& payload) {
  PayloadReader reader(payload);
  bool ok = reader.get_bool();
  std::string message = reader.get_string();
  reader.expect_end();
  return {ok, message};
}

} // namespace protocol
} // namespace session
} // namespace fstore
