#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hcodec {

// Whole-file binary read/write. Throw std::runtime_error on I/O failure.
std::vector<uint8_t> read_all(const std::string& path);
void write_all(const std::string& path, const std::vector<uint8_t>& bytes);

} // namespace hcodec
