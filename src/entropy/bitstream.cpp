#include "entropy/bitstream.hpp"

#include <string>

namespace hcodec {

namespace {
static uint16_t read_u16_le_at(const std::vector<uint8_t>& b, size_t off) {
    if (off + 2 > b.size()) throw std::runtime_error("bitstream: premature EOF (u16)");
    return static_cast<uint16_t>(b[off] | (static_cast<uint16_t>(b[off + 1]) << 8));
}
static uint32_t read_u32_le_at(const std::vector<uint8_t>& b, size_t off) {
    if (off + 4 > b.size()) throw std::runtime_error("bitstream: premature EOF (u32)");
    return static_cast<uint32_t>(b[off] |
                                 (static_cast<uint32_t>(b[off + 1]) << 8) |
                                 (static_cast<uint32_t>(b[off + 2]) << 16) |
                                 (static_cast<uint32_t>(b[off + 3]) << 24));
}
static uint64_t read_u64_le_at(const std::vector<uint8_t>& b, size_t off) {
    uint64_t lo = read_u32_le_at(b, off);
    uint64_t hi = read_u32_le_at(b, off + 4);
    return lo | (hi << 32);
}
} // namespace

void write_bitstream_header(ByteWriter& w,
                            uint64_t original_bytes,
                            uint32_t tree_bytes,
                            uint32_t payload_bytes) {
    HCodecHeader hdr{};
    // "HCDC"
    hdr.magic[0] = 'H';
    hdr.magic[1] = 'C';
    hdr.magic[2] = 'D';
    hdr.magic[3] = 'C';
    hdr.header_bytes = kHCodecHeaderBytes;
    hdr.flags = 0;
    hdr.original_bytes = original_bytes;
    hdr.tree_bytes = tree_bytes;
    hdr.payload_bytes = payload_bytes;

    w.write_bytes(hdr.magic, 4);
    w.write_u16_le(hdr.header_bytes);
    w.write_u16_le(hdr.flags);
    w.write_u64_le(hdr.original_bytes);
    w.write_u32_le(hdr.tree_bytes);
    w.write_u32_le(hdr.payload_bytes);
}

HCodecHeader read_bitstream_header(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kHCodecHeaderBytes) throw std::runtime_error("decode: file too small");

    HCodecHeader hdr{};
    hdr.magic[0] = static_cast<char>(bytes[0]);
    hdr.magic[1] = static_cast<char>(bytes[1]);
    hdr.magic[2] = static_cast<char>(bytes[2]);
    hdr.magic[3] = static_cast<char>(bytes[3]);
    hdr.header_bytes = read_u16_le_at(bytes, 4);
    hdr.flags = read_u16_le_at(bytes, 6);
    hdr.original_bytes = read_u64_le_at(bytes, 8);
    hdr.tree_bytes = read_u32_le_at(bytes, 16);
    hdr.payload_bytes = read_u32_le_at(bytes, 20);

    if (!(hdr.magic[0] == 'H' && hdr.magic[1] == 'C' && hdr.magic[2] == 'D' && hdr.magic[3] == 'C')) {
        throw std::runtime_error("decode: bad magic");
    }
    if (hdr.flags != 0) throw std::runtime_error("decode: unsupported flags");
    if (hdr.header_bytes < kHCodecHeaderBytes) throw std::runtime_error("decode: invalid header_bytes");
    if (bytes.size() < hdr.header_bytes) throw std::runtime_error("decode: truncated header");
    return hdr;
}

void write_coding_tree(ByteWriter& w, const CodingTree& tree) {
    std::vector<int> stack;
    stack.push_back(tree.root());
    while (!stack.empty()) {
        const CodingTree::Node& nd = tree.node(stack.back());
        stack.pop_back();
        switch (nd.kind) {
        case NodeKind::Branch:
            w.write_u8(kTreeTagBranch);
            // right then left so left is written first
            stack.push_back(nd.right);
            stack.push_back(nd.left);
            break;
        case NodeKind::Symbol:
            w.write_u8(kTreeTagSymbol);
            w.write_u32_le(nd.symbol);
            break;
        case NodeKind::EndOfInput:
            w.write_u8(kTreeTagEndOfInput);
            break;
        }
    }
}

CodingTree read_coding_tree(ByteReader& r) {
    // Child slot waiting for the next node in pre-order.
    struct Slot {
        int parent; // -1 for the root
        bool right;
    };
    std::vector<CodingTree::Node> nodes;
    std::vector<Slot> pending;
    pending.push_back({-1, false});
    int root = -1;

    while (!pending.empty()) {
        Slot slot = pending.back();
        pending.pop_back();

        CodingTree::Node nd;
        uint8_t tag = r.read_u8();
        switch (tag) {
        case kTreeTagBranch:
            nd.kind = NodeKind::Branch;
            break;
        case kTreeTagSymbol:
            nd.kind = NodeKind::Symbol;
            nd.symbol = r.read_u32_le();
            break;
        case kTreeTagEndOfInput:
            nd.kind = NodeKind::EndOfInput;
            break;
        default:
            throw std::runtime_error("decode: invalid coding tree tag " + std::to_string(tag));
        }

        const int idx = static_cast<int>(nodes.size());
        nodes.push_back(nd);
        if (slot.parent < 0) {
            root = idx;
        } else if (slot.right) {
            nodes[slot.parent].right = idx;
        } else {
            nodes[slot.parent].left = idx;
        }
        if (nd.kind == NodeKind::Branch) {
            pending.push_back({idx, true});
            pending.push_back({idx, false});
        }
    }
    return CodingTree(std::move(nodes), root);
}

} // namespace hcodec
