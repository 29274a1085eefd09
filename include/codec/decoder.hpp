#pragma once

#include <vector>
#include <cstdint>

namespace hcodec {

// Decode .hcodec bytes back to the original data.
std::vector<uint8_t> decode_from_hcodec(const std::vector<uint8_t>& bytes);

} // namespace hcodec
