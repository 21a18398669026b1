#include "session/tcp_session.hpp"
#include <future>
#include <utility>
#include <boost/log/trivial.hpp>
#include "crypto/digest.hpp"
#include "session/protocol.hpp"

namespace fstore {
namespace session {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpSession::TcpSession(SessionOptions options)
  : options_(std::move(options))
  , codec_(options_.session_key)
  , io_context_()
  , work_guard_(boost::asio::make_work_guard(io_context_))
  , socket_(io_context_) {
  BOOST_LOG_TRIVIAL(debug) << "TCP session: Created for " << options_.host << ":" << options_.port
                           << (codec_.is_encrypted() ? " (encrypted)" : " (plain)");
}

TcpSession::~TcpSession() {
  disconnect();
  BOOST_LOG_TRIVIAL(debug) << "TCP session: Destroyed";
}

//==============================================
// CONNECTION CONTROL
//==============================================

void TcpSession::connect() {
  if (!transition(ConnectionState::State::CONNECTING)) {
    throw SessionError(SessionErrorCode::CONNECTION_FAILED, "Session cannot connect from state " +
                       ConnectionState::state_to_string(state()));
  }

  BOOST_LOG_TRIVIAL(info) << "TCP session: Connecting to " << options_.host << ":" << options_.port;

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port), ec);
  if (!ec) {
    boost::asio::connect(socket_, endpoints, ec);
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP session: Connection failed: " << ec.message();
    transition(ConnectionState::State::FAILED);
    lost_ = true;
    throw SessionError(SessionErrorCode::CONNECTION_FAILED, ec.message());
  }

  boost::asio::ip::tcp::no_delay option(true);
  socket_.set_option(option, ec);

  transition(ConnectionState::State::HANDSHAKING);
  async_read_next();
  io_thread_ = std::thread([this]() {
    BOOST_LOG_TRIVIAL(debug) << "TCP session: I/O thread started";
    io_context_.run();
    BOOST_LOG_TRIVIAL(debug) << "TCP session: I/O thread finished";
  });

  try {
    protocol::HelloRequest hello{options_.service_name, crypto::Digest::sha256_hex(options_.verify_key)};
    call(MessageType::HELLO, protocol::encode(hello));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP session: Handshake failed: " << e.what();
    transition(ConnectionState::State::FAILED);
    lost_ = true;
    stop_io();
    fail_all_pending(SessionErrorCode::CONNECTION_FAILED, "handshake failed");
    throw;
  }

  transition(ConnectionState::State::READY);
  BOOST_LOG_TRIVIAL(info) << "TCP session: Connected to service '" << options_.service_name << "'";
}

void TcpSession::disconnect() {
  if (transition(ConnectionState::State::CLOSING)) {
    BOOST_LOG_TRIVIAL(info) << "TCP session: Disconnecting";
  }

  lost_ = true;
  stop_io();
  fail_all_pending(SessionErrorCode::CONNECTION_LOST, "session closed");
  transition(ConnectionState::State::CLOSED);
}

ConnectionState::State TcpSession::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return connection_state_.get_state();
}

bool TcpSession::transition(ConnectionState::State next) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto previous = connection_state_.get_state();
  if (!connection_state_.transition_to(next)) {
    BOOST_LOG_TRIVIAL(trace) << "TCP session: Ignored transition " << previous << " -> " << next;
    return false;
  }
  BOOST_LOG_TRIVIAL(debug) << "TCP session: State " << previous << " -> " << next;
  return true;
}

//==============================================
// REQUESTS
//==============================================

void TcpSession::send_request(MessageType type, std::vector<uint8_t> payload, ResponseHandler handler) {
  if (lost_) {
    throw SessionError(SessionErrorCode::CONNECTION_LOST, "session is no longer usable");
  }

  MessageFrame frame;
  frame.message_type = type;
  frame.request_id = next_request_id_++;
  frame.payload = std::move(payload);

  std::vector<uint8_t> bytes = codec_.encode(frame);

  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.emplace(frame.request_id,
                     PendingRequest{std::move(handler), std::make_shared<boost::asio::steady_timer>(io_context_)});
  }
  arm_timeout(frame.request_id);

  BOOST_LOG_TRIVIAL(trace) << "TCP session: Sending " << message_type_to_string(type)
                           << " #" << frame.request_id << " (" << bytes.size() << " bytes)";

  boost::system::error_code ec;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    boost::asio::write(socket_, boost::asio::buffer(bytes), ec);
  }

  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP session: Write failed: " << ec.message();
    mark_lost("write failed: " + ec.message());
  }
}

MessageFrame TcpSession::call(MessageType type, std::vector<uint8_t> payload) {
  auto promise = std::make_shared<std::promise<MessageFrame>>();
  std::future<MessageFrame> future = promise->get_future();

  send_request(type, std::move(payload), [promise](MessageFrame frame, std::exception_ptr error) {
    if (error) {
      promise->set_exception(error);
    } else {
      promise->set_value(std::move(frame));
    }
  });

  MessageFrame response = future.get();
  protocol::expect_ok(response);
  return response;
}

void TcpSession::arm_timeout(uint64_t request_id) {
  // Timers are only touched on the I/O thread
  boost::asio::post(io_context_, [this, request_id]() {
    std::shared_ptr<boost::asio::steady_timer> timer;
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      auto it = pending_.find(request_id);
      if (it == pending_.end()) {
        return;
      }
      timer = it->second.timer;
    }
    timer->expires_after(options_.request_timeout);
    timer->async_wait([this, request_id](const boost::system::error_code& ec) {
      if (!ec) {
        handle_timeout(request_id);
      }
    });
  });
}

void TcpSession::handle_timeout(uint64_t request_id) {
  ResponseHandler handler = take_pending(request_id);
  if (!handler) {
    return;
  }

  BOOST_LOG_TRIVIAL(warning) << "TCP session: Request #" << request_id << " timed out after "
                             << options_.request_timeout.count() << " ms";
  handler(MessageFrame{}, std::make_exception_ptr(
      SessionError(SessionErrorCode::TIMEOUT, "no response to request #" + std::to_string(request_id))));
}

TcpSession::ResponseHandler TcpSession::take_pending(uint64_t request_id) {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  auto it = pending_.find(request_id);
  if (it == pending_.end()) {
    return nullptr;
  }
  ResponseHandler handler = std::move(it->second.handler);
  it->second.timer->cancel();
  pending_.erase(it);
  return handler;
}

//==============================================
// SESSION INTERFACE
//==============================================

uint64_t TcpSession::open_write(const std::string& remote_path, uint64_t size,
                                const std::string& hash, bool overwrite) {
  protocol::OpenWriteRequest request{remote_path, size, hash, overwrite};
  return protocol::decode_u64(call(MessageType::OPEN_WRITE, protocol::encode(request)).payload);
}

WriteAck TcpSession::write_block(uint64_t key, const transfer::BlockSpec& block,
                                 const std::vector<uint8_t>& data) {
  protocol::WriteBlockRequest request{key, block, data};
  return protocol::decode_write_ack(call(MessageType::WRITE_BLOCK, protocol::encode(request)).payload);
}

uint64_t TcpSession::finish_write(uint64_t key) {
  return protocol::decode_u64(call(MessageType::FINISH_WRITE, protocol::encode_key(key)).payload);
}

void TcpSession::abort_write(uint64_t key) {
  call(MessageType::ABORT_WRITE, protocol::encode_key(key));
}

ReadGrant TcpSession::open_read(const std::string& remote_path) {
  return protocol::decode_read_grant(call(MessageType::OPEN_READ, protocol::encode_path(remote_path)).payload);
}

BlockData TcpSession::read_block(uint64_t key, const transfer::BlockSpec& block) {
  protocol::BlockRequest request{key, block};
  return protocol::decode_block_data(call(MessageType::READ_BLOCK, protocol::encode(request)).payload);
}

void TcpSession::read_block_async(uint64_t key, const transfer::BlockSpec& block, BlockCallback callback) {
  protocol::BlockRequest request{key, block};
  send_request(MessageType::READ_BLOCK, protocol::encode(request),
               [block, callback = std::move(callback)](MessageFrame frame, std::exception_ptr error) {
    BlockData data;
    if (!error) {
      try {
        protocol::expect_ok(frame);
        data = protocol::decode_block_data(frame.payload);
      } catch (const std::exception&) {
        error = std::current_exception();
      }
    }
    callback(block, std::move(data), error);
  });
}

void TcpSession::close_read(uint64_t key) {
  call(MessageType::CLOSE_READ, protocol::encode_key(key));
}

std::vector<RemoteFileInfo> TcpSession::list_directory(const std::string& remote_dir) {
  return protocol::decode_listing(call(MessageType::LIST_DIR, protocol::encode_path(remote_dir)).payload);
}

RemoteFileInfo TcpSession::file_info(const std::string& remote_path) {
  return protocol::decode_file_info(call(MessageType::FILE_INFO, protocol::encode_path(remote_path)).payload);
}

std::pair<bool, std::string> TcpSession::check_paths(const std::vector<std::string>& remote_paths,
                                                     bool overwrite) {
  protocol::CheckPathsRequest request{remote_paths, overwrite};
  return protocol::decode_check_result(call(MessageType::CHECK_PATHS, protocol::encode(request)).payload);
}

//==============================================
// INCOMING RESPONSES
//==============================================

void TcpSession::async_read_next() {
  boost::asio::async_read(
    socket_,
    boost::asio::buffer(length_buffer_),
    [this](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
      handle_read_length(ec);
    });
}

void TcpSession::handle_read_length(const boost::system::error_code& ec) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      BOOST_LOG_TRIVIAL(error) << "TCP session: Read error: " << ec.message();
      mark_lost("read failed: " + ec.message());
    }
    return;
  }

  uint32_t body_length = 0;
  try {
    body_length = FrameCodec::decode_length(length_buffer_);
  } catch (const SessionError& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP session: " << e.what();
    mark_lost(e.what());
    return;
  }

  body_buffer_.resize(body_length);
  boost::asio::async_read(
    socket_,
    boost::asio::buffer(body_buffer_),
    [this](const boost::system::error_code& read_ec, std::size_t /*bytes_transferred*/) {
      handle_read_body(read_ec);
    });
}

void TcpSession::handle_read_body(const boost::system::error_code& ec) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      BOOST_LOG_TRIVIAL(error) << "TCP session: Read error: " << ec.message();
      mark_lost("read failed: " + ec.message());
    }
    return;
  }

  MessageFrame frame;
  try {
    frame = codec_.decode_body(body_buffer_);
  } catch (const std::exception& e) {
    // The stream cannot be resynchronised after a bad frame
    BOOST_LOG_TRIVIAL(error) << "TCP session: Undecodable response: " << e.what();
    mark_lost(std::string("undecodable response: ") + e.what());
    return;
  }

  dispatch(std::move(frame));
  async_read_next();
}

void TcpSession::dispatch(MessageFrame frame) {
  BOOST_LOG_TRIVIAL(trace) << "TCP session: Received " << message_type_to_string(frame.message_type)
                           << " #" << frame.request_id;

  ResponseHandler handler = take_pending(frame.request_id);
  if (!handler) {
    BOOST_LOG_TRIVIAL(debug) << "TCP session: Dropping late response #" << frame.request_id;
    return;
  }
  handler(std::move(frame), nullptr);
}

//==============================================
// TEARDOWN
//==============================================

void TcpSession::mark_lost(const std::string& reason) {
  if (lost_.exchange(true)) {
    fail_all_pending(SessionErrorCode::CONNECTION_LOST, reason);
    return;
  }

  BOOST_LOG_TRIVIAL(error) << "TCP session: Session lost: " << reason;
  transition(ConnectionState::State::FAILED);

  boost::asio::post(io_context_, [this]() {
    boost::system::error_code ec;
    socket_.close(ec);
  });
  fail_all_pending(SessionErrorCode::CONNECTION_LOST, reason);
}

void TcpSession::fail_all_pending(SessionErrorCode code, const std::string& reason) {
  std::unordered_map<uint64_t, PendingRequest> failed;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    failed.swap(pending_);
  }

  if (!failed.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "TCP session: Failing " << failed.size() << " outstanding request(s): " << reason;
  }

  // Orphaned timers find no slot when they fire
  for (auto& entry : failed) {
    entry.second.handler(MessageFrame{}, std::make_exception_ptr(SessionError(code, reason)));
  }
}

void TcpSession::stop_io() {
  work_guard_.reset();
  io_context_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  boost::system::error_code ec;
  if (socket_.is_open()) {
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }
}

} // namespace session
} // namespace fstore
