#pragma once

#include <vector>
#include <cstdint>

namespace hcodec {

// Encode raw bytes to .hcodec bytes (header, coding tree, packed bits).
// Throws EmptyInputError on empty input.
std::vector<uint8_t> encode_to_hcodec(const std::vector<uint8_t>& data);

} // namespace hcodec
