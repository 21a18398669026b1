#ifndef FSTORE_TRANSFER_BLOCK_CODEC_HPP
#define FSTORE_TRANSFER_BLOCK_CODEC_HPP

#include <cstdint>
#include <iterator>
#include <ostream>

namespace fstore {
namespace transfer {

// One fixed-size slice of a file: bytes [offset, offset + length)
struct BlockSpec {
  uint64_t index{0};
  uint64_t offset{0};
  uint32_t length{0};

  bool operator==(const BlockSpec& other) const {
    return index == other.index && offset == other.offset && length == other.length;
  }
  bool operator!=(const BlockSpec& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const BlockSpec& block);

// Partitions [0, total_size) into ascending blocks of block_size bytes.
// The sequence is computed on demand and can be walked any number of times.
class BlockCodec {
public:
  static constexpr uint32_t DEFAULT_BLOCK_SIZE = 65536;

  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = BlockSpec;
    using difference_type = std::ptrdiff_t;
    using pointer = const BlockSpec*;
    using reference = BlockSpec;

    Iterator(const BlockCodec* codec, uint64_t index) : codec_(codec), index_(index) {}

    BlockSpec operator*() const { return codec_->block_at(index_); }
    Iterator& operator++() { ++index_; return *this; }
    Iterator operator++(int) { Iterator tmp = *this; ++index_; return tmp; }
    bool operator==(const Iterator& other) const { return index_ == other.index_; }
    bool operator!=(const Iterator& other) const { return index_ != other.index_; }

  private:
    const BlockCodec* codec_;
    uint64_t index_;
  };

  // ---- CONSTRUCTOR ----
  // Throws std::invalid_argument if block_size is zero
  BlockCodec(uint64_t total_size, uint32_t block_size = DEFAULT_BLOCK_SIZE);


  // ---- SEQUENCE ACCESS ----
  Iterator begin() const { return Iterator(this, 0); }
  Iterator end() const { return Iterator(this, block_count_); }
  // Throws std::out_of_range for index >= block_count()
  BlockSpec block_at(uint64_t index) const;


  // ---- GETTERS ----
  uint64_t total_size() const { return total_size_; }
  uint32_t block_size() const { return block_size_; }
  uint64_t block_count() const { return block_count_; }

private:
  uint64_t total_size_;
  uint32_t block_size_;
  uint64_t block_count_;
};

} // namespace transfer
} // namespace fstore

#endif // FSTORE_TRANSFER_BLOCK_CODEC_HPP
