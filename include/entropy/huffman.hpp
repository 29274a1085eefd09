#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "entropy/code_table.hpp"
#include "entropy/coding_tree.hpp"
#include "entropy/errors.hpp"
#include "entropy/frequency.hpp"

namespace hcodec {

// Pack each symbol's code in order, then the end-of-input code; zero-pad the
// last byte. Throws std::logic_error if a symbol has no code in table.
std::vector<uint8_t> pack_symbols(const CodeTable& table, const std::vector<Symbol>& symbols);

// Huffman encode: full pipeline from symbols -> (tree, bitstream).
// Throws EmptyInputError on empty input.
std::pair<CodingTree, std::vector<uint8_t>> huff_encode(const std::vector<Symbol>& symbols);

// Huffman decode up to the end-of-input code. Trailing padding is ignored.
// Throws TruncatedStreamError if bits run out first.
void huff_decode(const std::vector<uint8_t>& bits,
                 const CodingTree& tree,
                 std::vector<Symbol>& out);

} // namespace hcodec
