#include "codec/encoder.hpp"

#include "entropy/bitstream.hpp"
#include "entropy/huffman.hpp"

#include <cstdio>
#include <limits>
#include <stdexcept>

namespace hcodec {

std::vector<uint8_t> encode_to_hcodec(const std::vector<uint8_t>& data) {
    if (data.empty()) throw EmptyInputError("encode: empty input");

    //===Symbolization===//
    std::vector<Symbol> symbols(data.begin(), data.end());

    //===Entropy Coding===//
    auto encoded = huff_encode(symbols);
    const CodingTree& tree = encoded.first;
    const std::vector<uint8_t>& huff_bits = encoded.second;

#ifndef NDEBUG
    std::fprintf(stderr, "encode: %zu bytes, %zu tree leaves, %zu payload bytes\n",
                 data.size(), tree.leaf_count(), huff_bits.size());
    std::fprintf(stderr, "First 2 Huffman encoded bytes (binary):\n");
    for (int i = 0; i < 2 && i < static_cast<int>(huff_bits.size()); ++i) {
        std::fprintf(stderr, "0b");
        for (int bit = 7; bit >= 0; --bit) {
            std::fprintf(stderr, "%d", (huff_bits[i] >> bit) & 1);
        }
        std::fprintf(stderr, " ");
    }
    std::fprintf(stderr, "\n");
#endif

    //===Bitstream Writer===//
    ByteWriter tree_section;
    write_coding_tree(tree_section, tree);

    if (tree_section.size() > std::numeric_limits<uint32_t>::max() ||
        huff_bits.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("encode: section exceeds 4 GiB");
    }
    const uint32_t tree_bytes = static_cast<uint32_t>(tree_section.size());
    const uint32_t payload_bytes = static_cast<uint32_t>(huff_bits.size());

    ByteWriter w;
    write_bitstream_header(w, static_cast<uint64_t>(data.size()), tree_bytes, payload_bytes);
    w.write_bytes(tree_section.bytes().data(), tree_section.size());
    w.write_bytes(huff_bits.data(), huff_bits.size());

    const size_t expected_size = static_cast<size_t>(kHCodecHeaderBytes) + tree_bytes + payload_bytes;
    if (w.size() != expected_size) {
        throw std::runtime_error("encode: buffer size mismatch after writing sections");
    }
    return w.bytes();
}

} // namespace hcodec
