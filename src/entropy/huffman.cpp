#include "entropy/huffman.hpp"

#include "entropy/bit_io.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hcodec {

std::vector<uint8_t> pack_symbols(const CodeTable& table, const std::vector<Symbol>& symbols) {
    if (table.end_of_input.empty()) {
        throw std::logic_error("huffman encode: code table has no end-of-input code");
    }
    BitWriter bw;
    for (Symbol s : symbols) {
        const BitPath* code = table.find(s);
        if (code == nullptr) {
            throw std::logic_error("huffman encode: symbol not in table");
        }
        bw.write_bits(*code);
    }
    bw.write_bits(table.end_of_input);
#ifndef NDEBUG
    std::fprintf(stderr, "huffman encode: %zu symbols -> %llu bits\n",
                 symbols.size(), static_cast<unsigned long long>(bw.bit_count()));
#endif
    bw.flush();
    return bw.take();
}

std::pair<CodingTree, std::vector<uint8_t>> huff_encode(const std::vector<Symbol>& symbols) {
    if (symbols.empty()) {
        throw EmptyInputError("huffman encode: empty symbols");
    }
    FrequencyTable freqs;
    build_symbol_frequencies(symbols, freqs);
    CodingTree tree = build_coding_tree(freqs);
    CodeTable table = derive_code_table(tree);
    std::vector<uint8_t> bits = pack_symbols(table, symbols);
    return {std::move(tree), std::move(bits)};
}

void huff_decode(const std::vector<uint8_t>& bits,
                 const CodingTree& tree,
                 std::vector<Symbol>& out) {
    BitReader br(bits);
    out.clear();
    int node = tree.root();
    while (true) {
        const CodingTree::Node& nd = tree.node(node);
        if (nd.kind == NodeKind::EndOfInput) {
            return;
        }
        if (nd.kind == NodeKind::Symbol) {
            out.push_back(nd.symbol);
            node = tree.root();
            continue;
        }
        if (br.exhausted()) {
            throw TruncatedStreamError("huffman decode: not enough bits after " +
                                       std::to_string(out.size()) + " symbols");
        }
        node = br.read_bit() ? nd.right : nd.left;
    }
}

#ifndef NDEBUG
namespace {
// Minimal self-test: build tree, encode, decode.
struct HuffmanSelfTest {
    HuffmanSelfTest() {
        std::vector<Symbol> symbols = {3, 0, 1, 3, 2, 2, 3};
        //encode
        auto encoded = huff_encode(symbols);

        //decode
        std::vector<Symbol> decoded;
        huff_decode(encoded.second, encoded.first, decoded);
        if (decoded != symbols) {
            throw std::runtime_error("huffman self-test: round-trip mismatch");
        }
    }
};
static HuffmanSelfTest _huff_self_test{};
} // namespace
#endif

} // namespace hcodec
