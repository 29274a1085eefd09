#include "entropy/code_table.hpp"

#include <utility>

namespace hcodec {

CodeTable derive_code_table(const CodingTree& tree) {
    CodeTable t;
    t.symbols.reserve(tree.leaf_count());

    std::vector<std::pair<int, BitPath>> stack; // (node index, path so far)
    stack.push_back({tree.root(), BitPath{}});

    while (!stack.empty()) {
        auto [idx, path] = std::move(stack.back());
        stack.pop_back();
        const CodingTree::Node& cur = tree.node(idx);
        switch (cur.kind) {
        case NodeKind::EndOfInput:
            t.end_of_input = std::move(path);
            break;
        case NodeKind::Symbol:
            t.symbols.emplace(cur.symbol, std::move(path));
            break;
        case NodeKind::Branch: {
            // push right then left so left is processed first
            BitPath right = path;
            right.push_back(true);
            stack.push_back({cur.right, std::move(right)});
            path.push_back(false);
            stack.push_back({cur.left, std::move(path)});
            break;
        }
        }
    }
    return t;
}

} // namespace hcodec
