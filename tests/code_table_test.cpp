#include "entropy/code_table.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

namespace hcodec {
namespace {

bool is_prefix(const BitPath& a, const BitPath& b) {
    return a.size() <= b.size() && std::equal(a.begin(), a.end(), b.begin());
}

TEST(CodeTableTest, AaabCodes) {
    CodeTable t = derive_code_table(build_coding_tree({{97, 3}, {98, 1}}));
    ASSERT_EQ(t.symbols.size(), 2u);
    EXPECT_EQ(*t.find(97), (BitPath{true}));
    EXPECT_EQ(*t.find(98), (BitPath{false, true}));
    EXPECT_EQ(t.end_of_input, (BitPath{false, false}));
    EXPECT_EQ(t.find(99), nullptr);
}

TEST(CodeTableTest, SingleSymbolCodes) {
    CodeTable t = derive_code_table(build_coding_tree({{0, 1}}));
    EXPECT_EQ(*t.find(0), (BitPath{true}));
    EXPECT_EQ(t.end_of_input, (BitPath{false}));
}

TEST(CodeTableTest, EveryTerminalHasOnePrefixFreeCode) {
    FrequencyTable freqs;
    for (Symbol s = 0; s < 200; ++s) {
        freqs.push_back({s, 1 + (s * 37u) % 101u});
    }
    CodingTree tree = build_coding_tree(freqs);
    CodeTable t = derive_code_table(tree);
    ASSERT_EQ(t.symbols.size(), freqs.size());

    std::vector<BitPath> codes{t.end_of_input};
    for (const auto& kv : t.symbols) codes.push_back(kv.second);
    for (const BitPath& c : codes) {
        EXPECT_GE(c.size(), 1u);
        EXPECT_LE(c.size(), tree.depth());
    }
    for (size_t i = 0; i < codes.size(); ++i) {
        for (size_t j = 0; j < codes.size(); ++j) {
            if (i == j) continue;
            EXPECT_FALSE(is_prefix(codes[i], codes[j])) << "code " << i << " prefixes code " << j;
        }
    }
}

TEST(CodeTableTest, MoreFrequentSymbolsGetCodesNoLonger) {
    CodeTable t = derive_code_table(build_coding_tree({{1, 100}, {2, 10}, {3, 1}}));
    EXPECT_LE(t.find(1)->size(), t.find(2)->size());
    EXPECT_LE(t.find(2)->size(), t.find(3)->size());
}

} // namespace
} // namespace hcodec
