#include "entropy/bit_io.hpp"

#include "entropy/errors.hpp"

namespace hcodec {

void BitWriter::write_bit(bool bit) {
    cur_ = static_cast<uint8_t>((cur_ << 1) | (bit ? 1u : 0u));
    ++bit_pos_;
    ++bit_count_;
    if (bit_pos_ == 8) {
        data_.push_back(cur_);
        cur_ = 0;
        bit_pos_ = 0;
    }
}

void BitWriter::write_bits(const BitPath& bits) {
    for (bool b : bits) {
        write_bit(b);
    }
}

void BitWriter::flush() {
    if (bit_pos_ > 0) {
        cur_ = static_cast<uint8_t>(cur_ << (8 - bit_pos_));
        data_.push_back(cur_);
        cur_ = 0;
        bit_pos_ = 0;
    }
}

bool BitReader::read_bit() {
    if (exhausted()) {
        throw TruncatedStreamError("bitstream: out of data");
    }
    uint8_t byte = data_[byte_idx_];
    uint8_t bit = static_cast<uint8_t>((byte >> (7 - bit_pos_)) & 1u);
    ++bit_pos_;
    if (bit_pos_ == 8) {
        bit_pos_ = 0;
        ++byte_idx_;
    }
    return bit != 0;
}

} // namespace hcodec
