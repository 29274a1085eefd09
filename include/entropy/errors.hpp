#pragma once

#include <stdexcept>
#include <string>

namespace hcodec {

// Nothing to build a frequency table from.
class EmptyInputError : public std::runtime_error {
public:
    explicit EmptyInputError(const std::string& what) : std::runtime_error(what) {}
};

// Bitstream ended before the end-of-input code was reached.
class TruncatedStreamError : public std::runtime_error {
public:
    explicit TruncatedStreamError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace hcodec
