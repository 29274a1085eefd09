#include "entropy/frequency.hpp"

#include <algorithm>
#include <unordered_map>

namespace hcodec {

void build_symbol_frequencies(const std::vector<Symbol>& symbols, FrequencyTable& sym_freq) {
    std::unordered_map<Symbol, uint64_t> freq_map;
    for (Symbol s : symbols) {
        ++freq_map[s];
    }
    sym_freq.clear();
    sym_freq.reserve(freq_map.size());
    for (const auto& kv : freq_map) {
        sym_freq.push_back(kv);
    }
    std::sort(sym_freq.begin(), sym_freq.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
}

} // namespace hcodec
