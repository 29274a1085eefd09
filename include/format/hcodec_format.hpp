#pragma once

#include <cstdint>

namespace hcodec {

// IMPORTANT:
// Do NOT write/read this struct by dumping raw memory or using sizeof(HCodecHeader).
// Struct padding/alignment is compiler-dependent. Always serialize field-by-field.
inline constexpr uint16_t kHCodecHeaderBytes = 24; // fixed on-disk header size

// .hcodec file layout:
// [Header][coding tree][packed bits]
//
// Header fields are little-endian.
struct HCodecHeader {
    char     magic[4];        // "HCDC"
    uint16_t header_bytes;    // fixed header size
    uint16_t flags;           // reserved, 0

    uint64_t original_bytes;  // length of the decoded data
    uint32_t tree_bytes;      // coding tree section
    uint32_t payload_bytes;   // packed bits section
};

// Coding tree section: pre-order node list, one tag byte per node.
enum TreeTag : uint8_t {
    kTreeTagBranch     = 0, // followed by left subtree, then right subtree
    kTreeTagSymbol     = 1, // followed by u32 symbol
    kTreeTagEndOfInput = 2,
};

} // namespace hcodec
