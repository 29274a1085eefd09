#include "entropy/coding_tree.hpp"

#include "entropy/errors.hpp"

#include <cstdio>
#include <queue>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace hcodec {

CodingTree::CodingTree(std::vector<Node> nodes, int root)
    : nodes_(std::move(nodes)), root_(root) {
    const int n = static_cast<int>(nodes_.size());
    if (root_ < 0 || root_ >= n) {
        throw std::invalid_argument("tree: root index out of range");
    }
    if (nodes_[root_].kind != NodeKind::Branch) {
        throw std::invalid_argument("tree: root must be a branch");
    }

    std::vector<bool> seen(nodes_.size(), false);
    std::unordered_set<Symbol> symbols;
    size_t eoi_count = 0;

    std::vector<std::pair<int, size_t>> stack; // (node index, depth)
    stack.push_back({root_, 0});
    while (!stack.empty()) {
        auto [idx, d] = stack.back();
        stack.pop_back();
        if (idx < 0 || idx >= n) {
            throw std::invalid_argument("tree: child index out of range");
        }
        if (seen[idx]) {
            throw std::invalid_argument("tree: node reachable more than once");
        }
        seen[idx] = true;

        const Node& cur = nodes_[idx];
        switch (cur.kind) {
        case NodeKind::Branch:
            stack.push_back({cur.right, d + 1});
            stack.push_back({cur.left, d + 1});
            continue;
        case NodeKind::Symbol:
            if (!symbols.insert(cur.symbol).second) {
                throw std::invalid_argument("tree: duplicate symbol leaf");
            }
            break;
        case NodeKind::EndOfInput:
            ++eoi_count;
            break;
        default:
            throw std::invalid_argument("tree: unknown node kind");
        }
        if (cur.left != -1 || cur.right != -1) {
            throw std::invalid_argument("tree: terminal node with children");
        }
        ++leaves_;
        if (d > depth_) depth_ = d;
    }

    if (eoi_count != 1) {
        throw std::invalid_argument("tree: expected exactly one end-of-input leaf");
    }
    for (bool s : seen) {
        if (!s) throw std::invalid_argument("tree: unreachable node");
    }
}

namespace {

// Working priority entry; frequency annotations never reach the CodingTree.
struct HeapNode {
    uint64_t freq;
    uint64_t order; // insertion sequence, tie-break for equal freq
    int index;      // into the node array under construction
};

struct HeapComp {
    bool operator()(const HeapNode& a, const HeapNode& b) const {
        if (a.freq != b.freq) return a.freq > b.freq; // min-heap
        return a.order > b.order;
    }
};

} // namespace

CodingTree build_coding_tree(const FrequencyTable& sym_freq) {
    if (sym_freq.empty()) {
        throw EmptyInputError("huffman: empty symbol-frequency list");
    }

    std::vector<CodingTree::Node> nodes;
    nodes.reserve(2 * (sym_freq.size() + 1) - 1);
    std::priority_queue<HeapNode, std::vector<HeapNode>, HeapComp> pq;
    uint64_t order = 0;

    // end-of-input leaf, frequency 0
    nodes.push_back({NodeKind::EndOfInput, 0, -1, -1});
    pq.push({0, order++, 0});

    for (const auto& [sym, f] : sym_freq) {
        int idx = static_cast<int>(nodes.size());
        nodes.push_back({NodeKind::Symbol, sym, -1, -1});
        pq.push({f, order++, idx});
    }

    while (pq.size() > 1) {
        HeapNode a = pq.top(); pq.pop();
        HeapNode b = pq.top(); pq.pop();
        int idx = static_cast<int>(nodes.size());
        nodes.push_back({NodeKind::Branch, 0, a.index, b.index});
        pq.push({a.freq + b.freq, order++, idx});
    }
    int root = pq.top().index;

    CodingTree tree(std::move(nodes), root);
#ifndef NDEBUG
    std::fprintf(stderr, "huffman: tree with %zu leaves, depth %zu (%zu distinct symbols)\n",
                 tree.leaf_count(), tree.depth(), sym_freq.size());
#endif
    return tree;
}

} // namespace hcodec
