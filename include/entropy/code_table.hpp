#pragma once

#include <unordered_map>
#include <vector>

#include "entropy/coding_tree.hpp"

namespace hcodec {

// Root-to-leaf path, false = left, true = right.
using BitPath = std::vector<bool>;

// Huffman encode key derived from a CodingTree.
struct CodeTable {
    std::unordered_map<Symbol, BitPath> symbols;
    BitPath end_of_input;

    // nullptr if s has no code.
    const BitPath* find(Symbol s) const {
        auto it = symbols.find(s);
        return it == symbols.end() ? nullptr : &it->second;
    }
};

// Depth-first walk assigning every terminal its path from the root.
CodeTable derive_code_table(const CodingTree& tree);

} // namespace hcodec
