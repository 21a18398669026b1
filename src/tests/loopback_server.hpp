#ifndef FSTORE_TEST_LOOPBACK_SERVER_HPP
#define FSTORE_TEST_LOOPBACK_SERVER_HPP

#include <algorithm>
#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "crypto/digest.hpp"
#include "session/frame_codec.hpp"
#include "session/protocol.hpp"

// Minimal file store answering the client protocol on 127.0.0.1, one
// connection at a time. Runs its own io_context thread.
class LoopbackServer {
public:
    using MessageFrame = fstore::session::MessageFrame;
    using MessageType = fstore::session::MessageType;
    using RemoteStatus = fstore::session::RemoteStatus;

    explicit LoopbackServer(const std::vector<uint8_t>& key = {},
                            std::string service_name = "filestore",
                            std::string verify_key = "123123")
        : codec_(key)
        , service_name_(std::move(service_name))
        , key_hash_(fstore::crypto::Digest::sha256_hex(verify_key))
        , acceptor_(io_context_, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {
        do_accept();
        thread_ = std::thread([this]() { io_context_.run(); });
    }

    ~LoopbackServer() {
        io_context_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    void put_file(const std::string& path, const std::vector<uint8_t>& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] = content;
    }

    std::optional<std::vector<uint8_t>> file(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        if (it == files_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Requests of this type are read but never answered
    void ignore(MessageType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        ignored_.insert(type);
    }

    // The connection is closed when a request of this type arrives
    void drop_on(MessageType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        drop_on_ = type;
    }

    // READ_BLOCK answers are held back until n are queued, then sent in
    // reverse order
    void reverse_reads(std::size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        reverse_batch_ = n;
    }

    std::size_t requests_seen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_seen_;
    }

private:
    fstore::session::FrameCodec codec_;
    std::string service_name_;
    std::string key_hash_;

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<boost::asio::ip::tcp::socket> socket_;
    std::thread thread_;

    std::array<uint8_t, fstore::session::FrameCodec::LENGTH_PREFIX_SIZE> length_buffer_{};
    std::vector<uint8_t> body_buffer_;

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<uint8_t>> files_;
    std::map<uint64_t, std::pair<std::string, std::vector<uint8_t>>> writes_;
    std::map<uint64_t, std::string> reads_;
    uint64_t next_key_{1};
    std::set<MessageType> ignored_;
    std::optional<MessageType> drop_on_;
    std::size_t reverse_batch_{0};
    std::vector<MessageFrame> held_reads_;
    std::size_t requests_seen_{0};

    void do_accept() {
        acceptor_.async_accept([this](const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket) {
            if (ec) {
                return;
            }
            socket_ = std::make_shared<boost::asio::ip::tcp::socket>(std::move(socket));
            read_length();
            do_accept();
        });
    }

    void read_length() {
        auto socket = socket_;
        boost::asio::async_read(*socket, boost::asio::buffer(length_buffer_),
            [this, socket](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    return;
                }
                try {
                    body_buffer_.resize(fstore::session::FrameCodec::decode_length(length_buffer_));
                } catch (const std::exception& e) {
                    drop(*socket, e.what());
                    return;
                }
                boost::asio::async_read(*socket, boost::asio::buffer(body_buffer_),
                    [this, socket](const boost::system::error_code& body_ec, std::size_t) {
                        if (body_ec) {
                            return;
                        }
                        MessageFrame request;
                        try {
                            request = codec_.decode_body(body_buffer_);
                        } catch (const std::exception& e) {
                            drop(*socket, e.what());
                            return;
                        }
                        if (on_request(*socket, request)) {
                            read_length();
                        }
                    });
            });
    }

    static void drop(boost::asio::ip::tcp::socket& socket, const std::string& reason) {
        BOOST_LOG_TRIVIAL(warning) << "Loopback server: Dropping connection: " << reason;
        boost::system::error_code ec;
        socket.close(ec);
    }

    // Returns false once the connection has been dropped
    bool on_request(boost::asio::ip::tcp::socket& socket, const MessageFrame& request) {
        std::vector<MessageFrame> replies;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++requests_seen_;
            if (drop_on_ && *drop_on_ == request.message_type) {
                boost::system::error_code ec;
                socket.close(ec);
                return false;
            }
            if (ignored_.count(request.message_type)) {
                return true;
            }

            MessageFrame reply;
            try {
                reply = handle(request);
            } catch (const std::exception& e) {
                reply = error(request, RemoteStatus::INVALID, e.what());
            }
            if (request.message_type == MessageType::READ_BLOCK && reverse_batch_ > 0) {
                held_reads_.push_back(std::move(reply));
                if (held_reads_.size() < reverse_batch_) {
                    return true;
                }
                replies.assign(held_reads_.rbegin(), held_reads_.rend());
                held_reads_.clear();
            } else {
                replies.push_back(std::move(reply));
            }
        }

        for (const auto& reply : replies) {
            boost::system::error_code ec;
            boost::asio::write(socket, boost::asio::buffer(codec_.encode(reply)), ec);
            if (ec) {
                return false;
            }
        }
        return true;
    }

    static MessageFrame ok(const MessageFrame& request, std::vector<uint8_t> payload = {}) {
        return MessageFrame{MessageType::RESPONSE_OK, request.request_id, std::move(payload)};
    }

    static MessageFrame error(const MessageFrame& request, RemoteStatus status, const std::string& message) {
        return MessageFrame{MessageType::RESPONSE_ERROR, request.request_id,
                            fstore::session::protocol::encode_error(status, message)};
    }

    fstore::session::RemoteFileInfo info_for(const std::string& path) const {
        fstore::session::RemoteFileInfo info;
        auto slash = path.rfind('/');
        info.name = slash == std::string::npos ? path : path.substr(slash + 1);
        const auto& content = files_.at(path);
        info.size = content.size();
        info.hash = fstore::crypto::Digest::sha256_hex(std::string(content.begin(), content.end()));
        info.create_time = 1700000000;
        info.can_modify = true;
        return info;
    }

    // Caller holds the lock
    MessageFrame handle(const MessageFrame& request) {
        namespace protocol = fstore::session::protocol;

        switch (request.message_type) {
            case MessageType::HELLO: {
                auto hello = protocol::decode_hello(request.payload);
                if (hello.service_name != service_name_ || hello.key_hash != key_hash_) {
                    return error(request, RemoteStatus::REJECTED, "verification failed");
                }
                return ok(request);
            }
            case MessageType::OPEN_WRITE: {
                auto open = protocol::decode_open_write(request.payload);
                if (files_.count(open.path) && !open.overwrite) {
                    return error(request, RemoteStatus::ALREADY_EXISTS, open.path);
                }
                uint64_t key = next_key_++;
                writes_[key] = {open.path, {}};
                return ok(request, protocol::encode_u64(key));
            }
            case MessageType::WRITE_BLOCK: {
                auto write = protocol::decode_write_block(request.payload);
                auto it = writes_.find(write.key);
                if (it == writes_.end()) {
                    return error(request, RemoteStatus::INVALID, "unknown key");
                }
                auto& content = it->second.second;
                content.insert(content.end(), write.data.begin(), write.data.end());
                return ok(request, protocol::encode(fstore::session::WriteAck{
                    write.block.index, static_cast<uint32_t>(write.data.size())}));
            }
            case MessageType::FINISH_WRITE: {
                auto it = writes_.find(protocol::decode_key(request.payload));
                if (it == writes_.end()) {
                    return error(request, RemoteStatus::INVALID, "unknown key");
                }
                uint64_t size = it->second.second.size();
                files_[it->second.first] = std::move(it->second.second);
                writes_.erase(it);
                return ok(request, protocol::encode_u64(size));
            }
            case MessageType::ABORT_WRITE:
                writes_.erase(protocol::decode_key(request.payload));
                return ok(request);
            case MessageType::OPEN_READ: {
                std::string path = protocol::decode_path(request.payload);
                if (!files_.count(path)) {
                    return error(request, RemoteStatus::NOT_FOUND, path);
                }
                uint64_t key = next_key_++;
                reads_[key] = path;
                return ok(request, protocol::encode(fstore::session::ReadGrant{key, info_for(path)}));
            }
            case MessageType::READ_BLOCK: {
                auto read = protocol::decode_block_request(request.payload);
                auto it = reads_.find(read.key);
                if (it == reads_.end()) {
                    return error(request, RemoteStatus::INVALID, "unknown key");
                }
                const auto& content = files_.at(it->second);
                fstore::session::BlockData data;
                data.index = read.block.index;
                data.offset = read.block.offset;
                uint64_t end = std::min<uint64_t>(content.size(), read.block.offset + read.block.length);
                if (read.block.offset < end) {
                    data.bytes.assign(content.begin() + static_cast<std::ptrdiff_t>(read.block.offset),
                                      content.begin() + static_cast<std::ptrdiff_t>(end));
                }
                return ok(request, protocol::encode(data));
            }
            case MessageType::CLOSE_READ:
                reads_.erase(protocol::decode_key(request.payload));
                return ok(request);
            case MessageType::LIST_DIR: {
                std::string dir = protocol::decode_path(request.payload);
                std::string prefix = dir.empty() ? dir : dir + "/";
                std::vector<fstore::session::RemoteFileInfo> entries;
                for (const auto& entry : files_) {
                    if (entry.first.compare(0, prefix.size(), prefix) == 0 &&
                        entry.first.find('/', prefix.size()) == std::string::npos) {
                        entries.push_back(info_for(entry.first));
                    }
                }
                return ok(request, protocol::encode(entries));
            }
            case MessageType::FILE_INFO: {
                std::string path = protocol::decode_path(request.payload);
                if (!files_.count(path)) {
                    return error(request, RemoteStatus::NOT_FOUND, path);
                }
                return ok(request, protocol::encode(info_for(path)));
            }
            case MessageType::CHECK_PATHS: {
                auto check = protocol::decode_check_paths(request.payload);
                for (const auto& path : check.paths) {
                    if (files_.count(path) && !check.overwrite) {
                        return ok(request, protocol::encode_check_result(false, path + " exists"));
                    }
                }
                return ok(request, protocol::encode_check_result(true, ""));
            }
            default:
                return error(request, RemoteStatus::INVALID, "unexpected request");
        }
    }
};

#endif // FSTORE_TEST_LOOPBACK_SERVER_HPP
