#include "entropy/frequency.hpp"

#include <gtest/gtest.h>

namespace hcodec {
namespace {

TEST(FrequencyTest, CountsDistinctSymbols) {
    FrequencyTable freqs;
    build_symbol_frequencies({97, 97, 97, 98}, freqs);
    ASSERT_EQ(freqs.size(), 2u);
    EXPECT_EQ(freqs[0], (std::pair<Symbol, uint64_t>{97, 3}));
    EXPECT_EQ(freqs[1], (std::pair<Symbol, uint64_t>{98, 1}));
}

TEST(FrequencyTest, SortedBySymbol) {
    FrequencyTable freqs;
    build_symbol_frequencies({9, 1, 5, 1, 9, 9, 70000}, freqs);
    ASSERT_EQ(freqs.size(), 4u);
    EXPECT_EQ(freqs[0].first, 1u);
    EXPECT_EQ(freqs[1].first, 5u);
    EXPECT_EQ(freqs[2].first, 9u);
    EXPECT_EQ(freqs[3].first, 70000u);
    EXPECT_EQ(freqs[2].second, 3u);
}

TEST(FrequencyTest, EmptyInputGivesEmptyTable) {
    FrequencyTable freqs{{1, 1}};
    build_symbol_frequencies({}, freqs);
    EXPECT_TRUE(freqs.empty());
}

} // namespace
} // namespace hcodec
