#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "entropy/frequency.hpp"

namespace hcodec {

enum class NodeKind : uint8_t {
    Branch     = 0,
    Symbol     = 1,
    EndOfInput = 2,
};

// Immutable Huffman decode key. Nodes live in one flat array owned by the
// tree; every node except the root is the child of exactly one branch.
class CodingTree {
public:
    struct Node {
        NodeKind kind{NodeKind::Branch};
        Symbol symbol{0};  // valid for NodeKind::Symbol only
        int left{-1};      // index into nodes, -1 for terminals
        int right{-1};
    };

    // Throws std::invalid_argument unless nodes form a tree rooted at a branch
    // with exactly one end-of-input leaf and no repeated symbol.
    CodingTree(std::vector<Node> nodes, int root);

    int root() const { return root_; }
    const Node& node(int idx) const { return nodes_[static_cast<size_t>(idx)]; }
    size_t node_count() const { return nodes_.size(); }
    size_t leaf_count() const { return leaves_; }
    // Length of the longest root-to-leaf path.
    size_t depth() const { return depth_; }

private:
    std::vector<Node> nodes_;
    int root_{-1};
    size_t leaves_{0};
    size_t depth_{0};
};

// Greedy Huffman merge over freqs plus a zero-frequency end-of-input leaf.
// Ties on frequency are broken by insertion order (end-of-input first, then
// table order, then merged branches in creation order); the first node popped
// becomes the left child.
// Throws EmptyInputError if sym_freq is empty.
CodingTree build_coding_tree(const FrequencyTable& sym_freq);

} // namespace hcodec
