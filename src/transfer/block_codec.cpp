#include "transfer/block_codec.hpp"
#include <stdexcept>
#include <string>

namespace fstore {
namespace transfer {

std::ostream& operator<<(std::ostream& os, const BlockSpec& block) {
  return os << "{" << block.index << "," << block.offset << "," << block.length << "}";
}

BlockCodec::BlockCodec(uint64_t total_size, uint32_t block_size)
  : total_size_(total_size)
  , block_size_(block_size)
  , block_count_(0) {
  if (block_size_ == 0) {
    throw std::invalid_argument("Block codec: block size must be greater than zero");
  }
  block_count_ = total_size_ / block_size_ + (total_size_ % block_size_ != 0 ? 1 : 0);
}

BlockSpec BlockCodec::block_at(uint64_t index) const {
  if (index >= block_count_) {
    throw std::out_of_range("Block codec: block index " + std::to_string(index) +
                            " out of range (" + std::to_string(block_count_) + " blocks)");
  }

  BlockSpec block;
  block.index = index;
  block.offset = index * block_size_;

  // Only the last block can be short
  uint64_t remaining = total_size_ - block.offset;
  block.length = remaining < block_size_ ? static_cast<uint32_t>(remaining) : block_size_;
  return block;
}

} // namespace transfer
} // namespace fstore
