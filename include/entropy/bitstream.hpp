#pragma once

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include "entropy/coding_tree.hpp"
#include "format/hcodec_format.hpp"

namespace hcodec {

class ByteWriter {
public:
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_le(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }
    void write_u32_le(uint32_t v) {
        write_u16_le(static_cast<uint16_t>(v & 0xFFFF));
        write_u16_le(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void write_u64_le(uint64_t v) {
        write_u32_le(static_cast<uint32_t>(v & 0xFFFFFFFFu));
        write_u32_le(static_cast<uint32_t>((v >> 32) & 0xFFFFFFFFu));
    }
    void write_bytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    size_t size() const { return buf_.size(); }
    const std::vector<uint8_t>& bytes() const { return buf_; }
private:
    std::vector<uint8_t> buf_;
};

class ByteReader {
public:
    explicit ByteReader(std::vector<uint8_t> data) : buf_(std::move(data)) {}

    uint8_t read_u8() {
        need(1);
        return buf_[pos_++];
    }
    uint16_t read_u16_le() {
        uint16_t lo = read_u8();
        uint16_t hi = read_u8();
        return static_cast<uint16_t>(lo | (hi << 8));
    }
    uint32_t read_u32_le() {
        uint32_t a = read_u16_le();
        uint32_t b = read_u16_le();
        return a | (b << 16);
    }
    uint64_t read_u64_le() {
        uint64_t a = read_u32_le();
        uint64_t b = read_u32_le();
        return a | (b << 32);
    }
    bool eof() const { return pos_ >= buf_.size(); }
private:
    void need(size_t n) {
        if (n > buf_.size() - pos_) throw std::runtime_error("bitstream: premature EOF");
    }
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
};

// Header is written with the final section sizes; callers know them up front.
void write_bitstream_header(ByteWriter& w,
                            uint64_t original_bytes,
                            uint32_t tree_bytes,
                            uint32_t payload_bytes);
HCodecHeader read_bitstream_header(const std::vector<uint8_t>& bytes);

// Coding tree section (pre-order, see TreeTag).
void write_coding_tree(ByteWriter& w, const CodingTree& tree);
// Consumes one tree from r. Throws std::runtime_error on a bad tag or short
// input, std::invalid_argument if the nodes do not form a valid tree.
CodingTree read_coding_tree(ByteReader& r);

} // namespace hcodec
