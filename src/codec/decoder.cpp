#include "codec/decoder.hpp"

#include "format/hcodec_format.hpp"

#include "entropy/bitstream.hpp"
#include "entropy/huffman.hpp"

#include <stdexcept>
#include <vector>

namespace hcodec {

std::vector<uint8_t> decode_from_hcodec(const std::vector<uint8_t>& bytes) {
    HCodecHeader hdr = read_bitstream_header(bytes);
    const uint64_t sections = static_cast<uint64_t>(hdr.header_bytes) + hdr.tree_bytes + hdr.payload_bytes;
    if (bytes.size() < sections) {
        throw std::runtime_error("decode: buffer smaller than declared section sizes");
    }

    // Coding tree section
    const size_t tree_start = hdr.header_bytes;
    const size_t tree_end = tree_start + hdr.tree_bytes;
    ByteReader r(std::vector<uint8_t>(bytes.begin() + tree_start, bytes.begin() + tree_end));
    CodingTree tree = read_coding_tree(r);
    if (!r.eof()) {
        throw std::runtime_error("decode: trailing bytes in coding tree section");
    }

    // Remaining are Huffman payload bits
    const size_t payload_end = tree_end + hdr.payload_bytes;
    std::vector<uint8_t> huff_bits(bytes.begin() + tree_end, bytes.begin() + payload_end);

    std::vector<Symbol> symbols;
    huff_decode(huff_bits, tree, symbols);

    if (symbols.size() != hdr.original_bytes) {
        throw std::runtime_error("decode: decoded length mismatch");
    }
    std::vector<uint8_t> out;
    out.reserve(symbols.size());
    for (Symbol s : symbols) {
        if (s > 0xFFu) {
            throw std::runtime_error("decode: symbol out of byte range");
        }
        out.push_back(static_cast<uint8_t>(s));
    }
    return out;
}

} // namespace hcodec
