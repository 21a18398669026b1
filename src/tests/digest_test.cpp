#include <gtest/gtest.h>
#include <string>
#include "crypto/digest.hpp"
#include "test_utils.hpp"

using namespace fstore::crypto;

namespace {
const char* const ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const char* const EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
}

TEST(DigestTest, KnownVectors) {
    EXPECT_EQ(Digest::sha256_hex("abc"), ABC_SHA256);
    EXPECT_EQ(Digest::sha256_hex(""), EMPTY_SHA256);
}

TEST(DigestTest, IncrementalMatchesOneShot) {
    Digest digest;
    digest.update("a", 1);
    digest.update("bc", 2);
    EXPECT_EQ(digest.hex_final(), ABC_SHA256);
}

TEST(DigestTest, UpdateAfterFinalThrows) {
    Digest digest;
    digest.hex_final();
    EXPECT_THROW(digest.update("x", 1), DigestError);
}

TEST(DigestTest, FileDigestSpansReadChunks) {
    TempDir dir;
    auto content = make_content(3 * 1024 * 1024 + 17);
    write_file(dir / "big.bin", content);

    EXPECT_EQ(Digest::file_sha256_hex(dir / "big.bin"), Digest::sha256_hex(to_string(content)));
}

TEST(DigestTest, MissingFileThrows) {
    TempDir dir;
    EXPECT_THROW(Digest::file_sha256_hex(dir / "absent"), DigestError);
}

TEST(DigestTest, FileErrorNamesDigestAndPath) {
    TempDir dir;
    try {
        Digest::file_sha256_hex(dir / "absent");
        FAIL() << "expected DigestError";
    } catch (const CryptoError& e) {
        const std::string message = e.what();
        EXPECT_EQ(message.rfind("Content digest failed: ", 0), 0u) << message;
        EXPECT_NE(message.find("absent"), std::string::npos) << message;
    }
}
