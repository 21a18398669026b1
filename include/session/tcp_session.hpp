#ifndef FSTORE_SESSION_TCP_SESSION_HPP
#define FSTORE_SESSION_TCP_SESSION_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <boost/asio.hpp>
#include "session/connection_state.hpp"
#include "session/frame_codec.hpp"
#include "session/session.hpp"
#include "session/session_error.hpp"

namespace fstore {
namespace session {

struct SessionOptions {
  std::string host{"127.0.0.1"};
  uint16_t port{6666};
  std::string service_name;
  // Only the SHA-256 of the key goes over the wire
  std::string verify_key;
  std::chrono::milliseconds request_timeout{5000};
  // Empty disables payload encryption
  std::vector<uint8_t> session_key;
};

// Session over a single TCP connection. Responses are read on a dedicated
// I/O thread and matched to their request by request id, so any number of
// requests may be outstanding at once.
class TcpSession : public Session {
public:
  explicit TcpSession(SessionOptions options);
  ~TcpSession() override;

  TcpSession(const TcpSession&) = delete;
  TcpSession& operator=(const TcpSession&) = delete;


  // ---- CONNECTION CONTROL ----
  // Connects and performs the HELLO handshake. Throws SessionError.
  void connect();
  // Fails every outstanding request and closes the socket
  void disconnect();
  ConnectionState::State state() const;


  // ---- SESSION INTERFACE ----
  uint64_t open_write(const std::string& remote_path, uint64_t size,
                      const std::string& hash, bool overwrite) override;
  WriteAck write_block(uint64_t key, const transfer::BlockSpec& block,
                       const std::vector<uint8_t>& data) override;
  uint64_t finish_write(uint64_t key) override;
  void abort_write(uint64_t key) override;

  ReadGrant open_read(const std::string& remote_path) override;
  BlockData read_block(uint64_t key, const transfer::BlockSpec& block) override;
  // Throws only when the session is already lost; every other outcome,
  // including a timeout, reaches the callback
  void read_block_async(uint64_t key, const transfer::BlockSpec& block,
                        BlockCallback callback) override;
  void close_read(uint64_t key) override;

  std::vector<RemoteFileInfo> list_directory(const std::string& remote_dir) override;
  RemoteFileInfo file_info(const std::string& remote_path) override;
  std::pair<bool, std::string> check_paths(const std::vector<std::string>& remote_paths,
                                           bool overwrite) override;

  bool is_lost() const override { return lost_; }

private:
  using ResponseHandler = std::function<void(MessageFrame, std::exception_ptr)>;

  struct PendingRequest {
    ResponseHandler handler;
    std::shared_ptr<boost::asio::steady_timer> timer;
  };

  // ---- PARAMETERS ----
  SessionOptions options_;
  FrameCodec codec_;

  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::ip::tcp::socket socket_;
  std::thread io_thread_;

  std::mutex write_mutex_;
  std::mutex pending_mutex_;
  std::unordered_map<uint64_t, PendingRequest> pending_;
  std::atomic<uint64_t> next_request_id_{1};
  std::atomic<bool> lost_{false};

  mutable std::mutex state_mutex_;
  ConnectionState connection_state_;

  std::array<uint8_t, FrameCodec::LENGTH_PREFIX_SIZE> length_buffer_{};
  std::vector<uint8_t> body_buffer_;


  // ---- REQUESTS ----
  // Registers a pending slot, arms its timeout and writes the frame
  void send_request(MessageType type, std::vector<uint8_t> payload, ResponseHandler handler);
  // Blocking request; returns the RESPONSE_OK frame or throws
  MessageFrame call(MessageType type, std::vector<uint8_t> payload);
  void arm_timeout(uint64_t request_id);
  void handle_timeout(uint64_t request_id);
  // Removes the slot and returns its handler, empty if already answered
  ResponseHandler take_pending(uint64_t request_id);


  // ---- INCOMING RESPONSES ----
  void async_read_next();
  void handle_read_length(const boost::system::error_code& ec);
  void handle_read_body(const boost::system::error_code& ec);
  void dispatch(MessageFrame frame);


  // ---- TEARDOWN ----
  void mark_lost(const std::string& reason);
  void fail_all_pending(SessionErrorCode code, const std::string& reason);
  void stop_io();
  bool transition(ConnectionState::State next);
};

} // namespace session
} // namespace fstore

#endif // FSTORE_SESSION_TCP_SESSION_HPP
