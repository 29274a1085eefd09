#include "entropy/huffman.hpp"
#include "entropy/stats.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace hcodec {
namespace {

std::vector<Symbol> to_symbols(const std::string& s) {
    std::vector<Symbol> out;
    for (unsigned char c : s) out.push_back(c);
    return out;
}

// Total weight of all merges, which equals the optimal weighted path length.
uint64_t greedy_merge_cost(const FrequencyTable& freqs) {
    std::multiset<uint64_t> pool{0};
    for (const auto& sf : freqs) pool.insert(sf.second);
    uint64_t cost = 0;
    while (pool.size() > 1) {
        uint64_t a = *pool.begin();
        pool.erase(pool.begin());
        uint64_t b = *pool.begin();
        pool.erase(pool.begin());
        cost += a + b;
        pool.insert(a + b);
    }
    return cost;
}

TEST(HuffmanTest, AaabRoundTrip) {
    std::vector<Symbol> in{97, 97, 97, 98};
    auto encoded = huff_encode(in);
    // 1 1 1 01 00 + one padding bit
    EXPECT_EQ(encoded.second, (std::vector<uint8_t>{0xE8}));

    std::vector<Symbol> out;
    huff_decode(encoded.second, encoded.first, out);
    EXPECT_EQ(out, in);
}

TEST(HuffmanTest, SingleSymbolInput) {
    std::vector<Symbol> in{'X'};
    auto encoded = huff_encode(in);
    EXPECT_EQ(encoded.first.leaf_count(), 2u);
    // symbol code "1", end-of-input "0"
    EXPECT_EQ(encoded.second, (std::vector<uint8_t>{0x80}));

    std::vector<Symbol> out;
    huff_decode(encoded.second, encoded.first, out);
    EXPECT_EQ(out, in);
}

TEST(HuffmanTest, EmptyInputThrows) {
    EXPECT_THROW(huff_encode({}), EmptyInputError);
}

TEST(HuffmanTest, RoundTripsText) {
    const std::vector<std::string> samples{
        "a",
        "ab",
        "abracadabra",
        "the quick brown fox jumps over the lazy dog",
        std::string(1000, 'z'),
    };
    for (const auto& s : samples) {
        std::vector<Symbol> in = to_symbols(s);
        auto encoded = huff_encode(in);
        std::vector<Symbol> out;
        huff_decode(encoded.second, encoded.first, out);
        EXPECT_EQ(out, in) << s;
    }
}

TEST(HuffmanTest, RoundTripsRandomWideSymbols) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<uint32_t> dist(0, 5000);
    std::vector<Symbol> in(20000);
    for (auto& s : in) s = dist(rng) % 37u == 0 ? 0xFFFFFFFFu : dist(rng);

    auto encoded = huff_encode(in);
    std::vector<Symbol> out;
    huff_decode(encoded.second, encoded.first, out);
    EXPECT_EQ(out, in);
}

TEST(HuffmanTest, PayloadLengthMatchesOptimalCost) {
    std::vector<Symbol> in;
    const std::vector<std::pair<Symbol, int>> counts{
        {'a', 45}, {'b', 13}, {'c', 12}, {'d', 16}, {'e', 9}, {'f', 5}};
    for (const auto& [sym, n] : counts) {
        for (int i = 0; i < n; ++i) in.push_back(sym);
    }

    FrequencyTable freqs;
    build_symbol_frequencies(in, freqs);
    CodingTree tree = build_coding_tree(freqs);
    CodeTable table = derive_code_table(tree);

    const uint64_t total = encoded_bit_length(table, freqs);
    const uint64_t symbol_bits = total - table.end_of_input.size();
    EXPECT_EQ(symbol_bits, 229u);
    EXPECT_EQ(symbol_bits, greedy_merge_cost(freqs));

    auto encoded = huff_encode(in);
    EXPECT_EQ(encoded.second.size(), (total + 7) / 8);
}

TEST(HuffmanTest, WeightedPathLengthIsOptimalForSkewedInput) {
    std::mt19937 rng(99);
    std::geometric_distribution<uint32_t> dist(0.15);
    std::vector<Symbol> in(5000);
    for (auto& s : in) s = dist(rng);

    FrequencyTable freqs;
    build_symbol_frequencies(in, freqs);
    CodeTable table = derive_code_table(build_coding_tree(freqs));
    EXPECT_EQ(encoded_bit_length(table, freqs) - table.end_of_input.size(),
              greedy_merge_cost(freqs));
}

TEST(HuffmanTest, DroppingLastByteNeverDecodesWrongly) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<uint32_t> len_dist(1, 300);
    std::uniform_int_distribution<uint32_t> sym_dist(0, 20);
    for (int round = 0; round < 50; ++round) {
        std::vector<Symbol> in(len_dist(rng));
        for (auto& s : in) s = sym_dist(rng);
        auto encoded = huff_encode(in);
        std::vector<uint8_t> cut(encoded.second.begin(), encoded.second.end() - 1);

        std::vector<Symbol> out;
        try {
            huff_decode(cut, encoded.first, out);
            EXPECT_EQ(out, in);
        } catch (const TruncatedStreamError&) {
            SUCCEED();
        }
    }
}

TEST(HuffmanTest, TruncatedStreamThrows) {
    auto encoded = huff_encode({97, 97, 97, 98});
    std::vector<Symbol> out;
    EXPECT_THROW(huff_decode({}, encoded.first, out), TruncatedStreamError);

    // 13 payload bits; the first byte alone ends at the root with no end-of-input
    auto longer = huff_encode({97, 97, 97, 98, 97, 97, 97, 97, 97, 97});
    ASSERT_GE(longer.second.size(), 2u);
    std::vector<uint8_t> first_byte{longer.second.front()};
    EXPECT_THROW(huff_decode(first_byte, longer.first, out), TruncatedStreamError);
}

TEST(HuffmanTest, IgnoresBitsAfterEndOfInput) {
    std::vector<Symbol> in{1, 2, 3, 1, 1};
    auto encoded = huff_encode(in);
    std::vector<uint8_t> padded = encoded.second;
    padded.push_back(0xFF);
    padded.push_back(0x00);

    std::vector<Symbol> out;
    huff_decode(padded, encoded.first, out);
    EXPECT_EQ(out, in);
}

TEST(HuffmanTest, PackSymbolsRejectsUnknownSymbol) {
    CodeTable table = derive_code_table(build_coding_tree({{1, 1}}));
    EXPECT_THROW(pack_symbols(table, {1, 2}), std::logic_error);
}

TEST(HuffmanTest, LongCodesRoundTrip) {
    FrequencyTable freqs;
    uint64_t a = 1, b = 1;
    for (Symbol s = 0; s < 40; ++s) {
        freqs.push_back({s, a});
        uint64_t next = a + b;
        a = b;
        b = next;
    }
    CodingTree tree = build_coding_tree(freqs);
    CodeTable table = derive_code_table(tree);
    ASSERT_EQ(table.find(0)->size(), 40u);

    std::vector<Symbol> in{0, 39, 1, 0, 20, 38, 0};
    std::vector<uint8_t> bits = pack_symbols(table, in);
    std::vector<Symbol> out;
    huff_decode(bits, tree, out);
    EXPECT_EQ(out, in);
}

} // namespace
} // namespace hcodec
