#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace hcodec {

using Symbol = uint32_t;

// (symbol, count) pairs, one per distinct symbol, sorted by symbol.
using FrequencyTable = std::vector<std::pair<Symbol, uint64_t>>;

// Build sparse (symbol,freq) list from a symbol stream.
void build_symbol_frequencies(const std::vector<Symbol>& symbols, FrequencyTable& sym_freq);

} // namespace hcodec
