#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <vector>
#include "crypto/crypto_error.hpp"
#include "session/frame_codec.hpp"
#include "session/session_error.hpp"

using namespace fstore::session;

class FrameCodecTest : public ::testing::Test {
protected:
    std::vector<uint8_t> key = std::vector<uint8_t>(32, 0x42);

    static MessageFrame sample_frame() {
        MessageFrame frame;
        frame.message_type = MessageType::READ_BLOCK;
        frame.request_id = 0x0102030405060708ull;
        frame.payload = {'p', 'a', 'y', 'l', 'o', 'a', 'd'};
        return frame;
    }

    static std::vector<uint8_t> body_of(const std::vector<uint8_t>& wire) {
        return std::vector<uint8_t>(wire.begin() + FrameCodec::LENGTH_PREFIX_SIZE, wire.end());
    }
};

TEST_F(FrameCodecTest, PlainFrameLayout) {
    FrameCodec codec;
    std::vector<uint8_t> wire = codec.encode(sample_frame());

    std::vector<uint8_t> expected = {
        0, 0, 0, 17,                // body length: 10 header + 7 payload
        7,                          // READ_BLOCK
        1, 2, 3, 4, 5, 6, 7, 8,     // request id
        0,                          // flags
        'p', 'a', 'y', 'l', 'o', 'a', 'd'
    };
    EXPECT_EQ(wire, expected);
}

TEST_F(FrameCodecTest, PlainSplitDecode) {
    FrameCodec codec;
    std::vector<uint8_t> wire = codec.encode(sample_frame());
    ASSERT_EQ(wire.size(), 21u);

    std::array<uint8_t, FrameCodec::LENGTH_PREFIX_SIZE> prefix{};
    std::copy(wire.begin(), wire.begin() + FrameCodec::LENGTH_PREFIX_SIZE, prefix.begin());
    EXPECT_EQ(FrameCodec::decode_length(prefix), 17u);

    MessageFrame decoded = codec.decode_body(body_of(wire));
    EXPECT_EQ(decoded.message_type, MessageType::READ_BLOCK);
    EXPECT_EQ(decoded.request_id, 0x0102030405060708ull);
    EXPECT_EQ(decoded.payload, sample_frame().payload);
}

TEST_F(FrameCodecTest, EncryptedPayloadIsSealed) {
    FrameCodec codec(key);
    std::vector<uint8_t> wire = codec.encode(sample_frame());

    // IV + one padded AES block
    EXPECT_EQ(wire.size(), FrameCodec::LENGTH_PREFIX_SIZE + FrameCodec::BODY_HEADER_SIZE + 16 + 16);
    EXPECT_EQ(wire[FrameCodec::LENGTH_PREFIX_SIZE + 9], FrameCodec::FLAG_ENCRYPTED);

    std::string text(wire.begin(), wire.end());
    EXPECT_EQ(text.find("payload"), std::string::npos);

    MessageFrame decoded = codec.decode_body(body_of(wire));
    EXPECT_EQ(decoded.payload, sample_frame().payload);
    EXPECT_EQ(decoded.request_id, sample_frame().request_id);
}

TEST_F(FrameCodecTest, SameFrameEncryptsDifferentlyEachTime) {
    FrameCodec codec(key);
    EXPECT_NE(codec.encode(sample_frame()), codec.encode(sample_frame()));
}

TEST_F(FrameCodecTest, EmptyPayloadEncrypted) {
    FrameCodec codec(key);
    MessageFrame frame;
    frame.message_type = MessageType::RESPONSE_OK;
    frame.request_id = 9;

    MessageFrame decoded = codec.decode_body(body_of(codec.encode(frame)));
    EXPECT_EQ(decoded.message_type, MessageType::RESPONSE_OK);
    EXPECT_TRUE(decoded.payload.empty());
}

TEST_F(FrameCodecTest, MismatchedEncryptionIsProtocolError) {
    FrameCodec plain;
    FrameCodec sealed(key);

    EXPECT_THROW(sealed.decode_body(body_of(plain.encode(sample_frame()))), SessionError);
    EXPECT_THROW(plain.decode_body(body_of(sealed.encode(sample_frame()))), SessionError);
}

TEST_F(FrameCodecTest, WrongKeyFailsToDecrypt) {
    FrameCodec sender(key);
    FrameCodec receiver(std::vector<uint8_t>(32, 0x17));
    EXPECT_ANY_THROW(receiver.decode_body(body_of(sender.encode(sample_frame()))));
}

TEST_F(FrameCodecTest, UnknownMessageTypeIsRejected) {
    FrameCodec codec;
    std::vector<uint8_t> body = {42, 0, 0, 0, 0, 0, 0, 0, 1, 0};
    try {
        codec.decode_body(body);
        FAIL() << "expected a protocol error";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), SessionErrorCode::PROTOCOL);
    }
}

TEST_F(FrameCodecTest, LengthPrefixLimits) {
    EXPECT_EQ(FrameCodec::decode_length({0, 0, 0, 10}), 10u);
    EXPECT_THROW(FrameCodec::decode_length({0, 0, 0, 9}), SessionError);
    EXPECT_THROW(FrameCodec::decode_length({0x04, 0, 0, 1}), SessionError);
}

TEST_F(FrameCodecTest, BodyShorterThanHeaderIsRejected) {
    FrameCodec codec;
    std::vector<uint8_t> body = body_of(codec.encode(sample_frame()));
    body.resize(FrameCodec::BODY_HEADER_SIZE - 1);
    EXPECT_THROW(codec.decode_body(body), SessionError);
}

TEST_F(FrameCodecTest, KeyMustBe32Bytes) {
    EXPECT_THROW(FrameCodec(std::vector<uint8_t>(16, 1)), fstore::crypto::InitializationError);
}
