#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "entropy/code_table.hpp"

namespace hcodec {

// MSB-first bit packer; the final partial byte is zero-padded by flush().
class BitWriter {
public:
    void write_bit(bool bit);
    void write_bits(const BitPath& bits);
    void flush();

    uint64_t bit_count() const { return bit_count_; }
    std::vector<uint8_t> take() { return std::move(data_); }

private:
    std::vector<uint8_t> data_;
    uint8_t cur_{0};
    uint8_t bit_pos_{0}; // bits filled in cur_ (0..8)
    uint64_t bit_count_{0};
};

// MSB-first bit reader over a borrowed buffer.
class BitReader {
public:
    explicit BitReader(const std::vector<uint8_t>& buf)
        : data_(buf) {}

    bool exhausted() const { return byte_idx_ >= data_.size(); }
    // Throws TruncatedStreamError when no bits remain.
    bool read_bit();

private:
    const std::vector<uint8_t>& data_;
    size_t byte_idx_{0};
    uint8_t bit_pos_{0};
};

} // namespace hcodec
