#pragma once

#include <cstdint>

#include "entropy/code_table.hpp"
#include "entropy/frequency.hpp"

namespace hcodec {

// Shannon entropy of the symbol distribution in bits per symbol (0 for empty).
double shannon_entropy(const FrequencyTable& sym_freq);

// Payload size in bits: sum(count * code length) + end-of-input code length.
// Throws std::logic_error if a symbol of sym_freq has no code.
uint64_t encoded_bit_length(const CodeTable& table, const FrequencyTable& sym_freq);

// Mean code length over the input symbols, end-of-input excluded.
double average_code_length(const CodeTable& table, const FrequencyTable& sym_freq);

} // namespace hcodec
