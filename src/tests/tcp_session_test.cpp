#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include "crypto/crypto_stream.hpp"
#include "session/tcp_session.hpp"
#include "transfer/pull_engine.hpp"
#include "transfer/push_engine.hpp"
#include "loopback_server.hpp"
#include "test_utils.hpp"

using namespace fstore::session;
using namespace fstore::transfer;

class TcpSessionTest : public ::testing::Test {
protected:
    std::unique_ptr<LoopbackServer> server;
    std::unique_ptr<TcpSession> session;
    std::unique_ptr<TempDir> dir;

    void SetUp() override {
        init_test_logging();
        dir = std::make_unique<TempDir>("tcp_session");
    }

    void TearDown() override {
        if (session) {
            session->disconnect();
        }
        session.reset();
        server.reset();
    }

    SessionOptions options_for(uint16_t port, const std::vector<uint8_t>& key = {}) {
        SessionOptions options;
        options.port = port;
        options.service_name = "filestore";
        options.verify_key = "123123";
        options.request_timeout = std::chrono::milliseconds(300);
        options.session_key = key;
        return options;
    }

    void start(const std::vector<uint8_t>& key = {}) {
        server = std::make_unique<LoopbackServer>(key);
        session = std::make_unique<TcpSession>(options_for(server->port(), key));
        session->connect();
    }

    FileResult push(const std::vector<uint8_t>& content, const std::string& remote, uint32_t block_size) {
        write_file(*dir / "upload", content);
        TransferDescriptor descriptor;
        descriptor.local_path = *dir / "upload";
        descriptor.remote_path = remote;
        descriptor.block_size = block_size;
        descriptor.overwrite = true;
        return PushEngine(*session, descriptor).run();
    }

    FileResult pull(const std::string& remote, TransferMode mode, uint32_t block_size, std::size_t window = 4) {
        TransferDescriptor descriptor;
        descriptor.remote_path = remote;
        descriptor.local_path = *dir / "download";
        descriptor.block_size = block_size;
        descriptor.overwrite = true;
        descriptor.mode = mode;
        descriptor.max_concurrency = window;
        return PullEngine(*session, descriptor).run();
    }
};

TEST_F(TcpSessionTest, HandshakeReachesReady) {
    start();
    EXPECT_EQ(session->state(), ConnectionState::State::READY);
    EXPECT_FALSE(session->is_lost());
    EXPECT_EQ(server->requests_seen(), 1u);
}

TEST_F(TcpSessionTest, WrongVerifyKeyIsRejected) {
    server = std::make_unique<LoopbackServer>(std::vector<uint8_t>{}, "filestore", "other-key");
    session = std::make_unique<TcpSession>(options_for(server->port()));

    try {
        session->connect();
        FAIL() << "Expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), SessionErrorCode::REMOTE);
        EXPECT_EQ(e.status(), RemoteStatus::REJECTED);
    }
    EXPECT_EQ(session->state(), ConnectionState::State::FAILED);
    EXPECT_TRUE(session->is_lost());
}

TEST_F(TcpSessionTest, NothingListening) {
    uint16_t port = 0;
    {
        LoopbackServer closed;
        port = closed.port();
    }
    session = std::make_unique<TcpSession>(options_for(port));

    try {
        session->connect();
        FAIL() << "Expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), SessionErrorCode::CONNECTION_FAILED);
    }
    EXPECT_EQ(session->state(), ConnectionState::State::FAILED);
}

TEST_F(TcpSessionTest, PlainRoundTrip) {
    start();
    auto content = make_content(150000);

    ASSERT_EQ(push(content, "docs/a.bin", 65536).outcome, Outcome::SUCCESS);
    auto stored = server->file("docs/a.bin");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, content);

    FileResult sync = pull("docs/a.bin", TransferMode::SYNC, 65536);
    ASSERT_EQ(sync.outcome, Outcome::SUCCESS) << sync.reason;
    EXPECT_EQ(read_file(*dir / "download"), content);

    FileResult async = pull("docs/a.bin", TransferMode::ASYNC, 4096, 8);
    ASSERT_EQ(async.outcome, Outcome::SUCCESS) << async.reason;
    EXPECT_EQ(read_file(*dir / "download"), content);
}

TEST_F(TcpSessionTest, EncryptedRoundTrip) {
    start(std::vector<uint8_t>(fstore::crypto::CryptoStream::KEY_SIZE, 0x5c));
    auto content = make_content(20000, 4);

    ASSERT_EQ(push(content, "secret.bin", 3000).outcome, Outcome::SUCCESS);
    FileResult result = pull("secret.bin", TransferMode::ASYNC, 3000, 3);
    ASSERT_EQ(result.outcome, Outcome::SUCCESS) << result.reason;
    EXPECT_EQ(read_file(*dir / "download"), content);
}

TEST_F(TcpSessionTest, MismatchedEncryptionFailsHandshake) {
    server = std::make_unique<LoopbackServer>(std::vector<uint8_t>(fstore::crypto::CryptoStream::KEY_SIZE, 0x01));
    session = std::make_unique<TcpSession>(options_for(server->port()));

    EXPECT_THROW(session->connect(), SessionError);
    EXPECT_TRUE(session->is_lost());
}

TEST_F(TcpSessionTest, OutOfOrderResponsesMatchTheirRequests) {
    start();
    auto content = make_content(4 * 1024);
    server->put_file("blocks.bin", content);
    server->reverse_reads(4);

    FileResult result = pull("blocks.bin", TransferMode::ASYNC, 1024, 4);
    ASSERT_EQ(result.outcome, Outcome::SUCCESS) << result.reason;
    EXPECT_EQ(read_file(*dir / "download"), content);
}

TEST_F(TcpSessionTest, UnansweredRequestTimesOut) {
    start();
    server->put_file("a.txt", make_content(10));
    server->ignore(MessageType::LIST_DIR);

    auto started = std::chrono::steady_clock::now();
    try {
        session->list_directory("");
        FAIL() << "Expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), SessionErrorCode::TIMEOUT);
    }
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(250));

    // A timeout does not end the session
    EXPECT_FALSE(session->is_lost());
    EXPECT_EQ(session->file_info("a.txt").size, 10u);
}

TEST_F(TcpSessionTest, AsyncTimeoutReachesCallback) {
    start();
    server->put_file("a.txt", make_content(2048));
    ReadGrant grant = session->open_read("a.txt");
    server->ignore(MessageType::READ_BLOCK);

    std::promise<std::exception_ptr> outcome;
    session->read_block_async(grant.key, BlockSpec{0, 0, 1024},
        [&outcome](const BlockSpec&, BlockData, std::exception_ptr error) { outcome.set_value(error); });

    auto future = outcome.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    std::exception_ptr error = future.get();
    ASSERT_TRUE(error);
    try {
        std::rethrow_exception(error);
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), SessionErrorCode::TIMEOUT);
    }
    session->close_read(grant.key);
}

TEST_F(TcpSessionTest, DroppedConnectionMarksSessionLost) {
    start();
    server->put_file("a.txt", make_content(10));
    server->drop_on(MessageType::FILE_INFO);

    try {
        session->file_info("a.txt");
        FAIL() << "Expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), SessionErrorCode::CONNECTION_LOST);
    }
    EXPECT_TRUE(session->is_lost());
    EXPECT_EQ(session->state(), ConnectionState::State::FAILED);

    try {
        session->list_directory("");
        FAIL() << "Expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), SessionErrorCode::CONNECTION_LOST);
    }
}

TEST_F(TcpSessionTest, RemoteErrorsCarryStatus) {
    start();
    server->put_file("a.txt", make_content(10));

    try {
        session->open_write("a.txt", 10, "", false);
        FAIL() << "Expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.status(), RemoteStatus::ALREADY_EXISTS);
    }

    auto verdict = session->check_paths({"a.txt", "b.txt"}, false);
    EXPECT_FALSE(verdict.first);
    EXPECT_TRUE(session->check_paths({"b.txt"}, false).first);
    EXPECT_FALSE(session->is_lost());
}

TEST_F(TcpSessionTest, DisconnectFailsLaterRequests) {
    start();
    session->disconnect();
    EXPECT_EQ(session->state(), ConnectionState::State::CLOSED);
    EXPECT_THROW(session->list_directory(""), SessionError);
}
