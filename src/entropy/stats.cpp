#include "entropy/stats.hpp"

#include <cmath>
#include <stdexcept>

namespace hcodec {

namespace {
uint64_t total_count(const FrequencyTable& sym_freq) {
    uint64_t total = 0;
    for (const auto& sf : sym_freq) total += sf.second;
    return total;
}

uint64_t symbol_bits(const CodeTable& table, const FrequencyTable& sym_freq) {
    uint64_t bits = 0;
    for (const auto& [sym, f] : sym_freq) {
        const BitPath* code = table.find(sym);
        if (code == nullptr) {
            throw std::logic_error("stats: symbol not in code table");
        }
        bits += f * static_cast<uint64_t>(code->size());
    }
    return bits;
}
} // namespace

double shannon_entropy(const FrequencyTable& sym_freq) {
    const uint64_t total = total_count(sym_freq);
    if (total == 0) return 0.0;
    double h = 0.0;
    for (const auto& sf : sym_freq) {
        if (sf.second == 0) continue;
        double p = static_cast<double>(sf.second) / static_cast<double>(total);
        h -= p * std::log2(p);
    }
    return h;
}

uint64_t encoded_bit_length(const CodeTable& table, const FrequencyTable& sym_freq) {
    return symbol_bits(table, sym_freq) + static_cast<uint64_t>(table.end_of_input.size());
}

double average_code_length(const CodeTable& table, const FrequencyTable& sym_freq) {
    const uint64_t total = total_count(sym_freq);
    if (total == 0) return 0.0;
    return static_cast<double>(symbol_bits(table, sym_freq)) / static_cast<double>(total);
}

} // namespace hcodec
