#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "transfer/block_codec.hpp"

using namespace fstore::transfer;

namespace {

std::vector<BlockSpec> collect(const BlockCodec& codec) {
    return std::vector<BlockSpec>(codec.begin(), codec.end());
}

} // namespace

TEST(BlockCodecTest, SplitsIntoFullBlocksAndShortTail) {
    BlockCodec codec(150000, 65536);

    std::vector<BlockSpec> expected = {
        {0, 0, 65536},
        {1, 65536, 65536},
        {2, 131072, 18928}
    };
    EXPECT_EQ(codec.block_count(), 3u);
    EXPECT_EQ(collect(codec), expected);
}

TEST(BlockCodecTest, EvenlyDivisibleSizeEndsWithFullBlock) {
    BlockCodec codec(4096, 1024);

    auto blocks = collect(codec);
    ASSERT_EQ(blocks.size(), 4u);
    EXPECT_EQ(blocks.back(), (BlockSpec{3, 3072, 1024}));
}

TEST(BlockCodecTest, EmptyFileHasNoBlocks) {
    BlockCodec codec(0, 65536);
    EXPECT_EQ(codec.block_count(), 0u);
    EXPECT_TRUE(codec.begin() == codec.end());
}

TEST(BlockCodecTest, FileSmallerThanBlockIsOneShortBlock) {
    BlockCodec codec(10, 65536);
    EXPECT_EQ(collect(codec), (std::vector<BlockSpec>{BlockSpec{0, 0, 10}}));
}

TEST(BlockCodecTest, DefaultBlockSizeIs64KiB) {
    BlockCodec codec(1);
    EXPECT_EQ(codec.block_size(), 65536u);
    EXPECT_EQ(BlockCodec::DEFAULT_BLOCK_SIZE, 65536u);
}

TEST(BlockCodecTest, ZeroBlockSizeIsRejected) {
    EXPECT_THROW(BlockCodec(100, 0), std::invalid_argument);
}

TEST(BlockCodecTest, BlockAtOutOfRangeThrows) {
    BlockCodec codec(100, 30);
    EXPECT_EQ(codec.block_at(3), (BlockSpec{3, 90, 10}));
    EXPECT_THROW(codec.block_at(4), std::out_of_range);
}

TEST(BlockCodecTest, SequenceIsRestartable) {
    BlockCodec codec(1000, 64);
    EXPECT_EQ(collect(codec), collect(codec));
}

TEST(BlockCodecTest, BlocksPartitionTheFileExactly) {
    for (uint64_t total : {1ull, 63ull, 64ull, 65ull, 1000ull, 4097ull}) {
        for (uint32_t block_size : {1u, 7u, 64u, 4096u}) {
            BlockCodec codec(total, block_size);
            uint64_t expected_offset = 0;
            uint64_t expected_index = 0;
            for (BlockSpec block : codec) {
                ASSERT_EQ(block.index, expected_index) << total << "/" << block_size;
                ASSERT_EQ(block.offset, expected_offset) << total << "/" << block_size;
                ASSERT_GT(block.length, 0u);
                ASSERT_LE(block.length, block_size);
                expected_offset += block.length;
                ++expected_index;
            }
            EXPECT_EQ(expected_offset, total) << total << "/" << block_size;
        }
    }
}

TEST(BlockCodecTest, LargeFileOffsetsDoNotOverflow) {
    const uint64_t total = 10ull * 1024 * 1024 * 1024 + 5;
    BlockCodec codec(total, 1 << 20);
    BlockSpec last = codec.block_at(codec.block_count() - 1);
    EXPECT_EQ(last.offset, 10ull * 1024 * 1024 * 1024);
    EXPECT_EQ(last.length, 5u);
}

TEST(BlockCodecTest, StreamsAsTriple) {
    std::ostringstream oss;
    oss << BlockSpec{2, 131072, 18928};
    EXPECT_EQ(oss.str(), "{2,131072,18928}");
}
