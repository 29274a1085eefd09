#include "codec/evaluation.hpp"

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "entropy/bitstream.hpp"
#include "entropy/huffman.hpp"
#include "entropy/stats.hpp"
#include "io/file_io.hpp"

#include <cstdio>
#include <ostream>
#include <stdexcept>

namespace hcodec {

FileMetrics evaluate_file(const std::vector<uint8_t>& data) {
    if (data.empty()) throw EmptyInputError("evaluate: empty input");
    FileMetrics m;
    m.original_bytes = data.size();

    std::vector<Symbol> symbols(data.begin(), data.end());
    FrequencyTable freqs;
    build_symbol_frequencies(symbols, freqs);
    CodeTable table = derive_code_table(build_coding_tree(freqs));
    m.entropy = shannon_entropy(freqs);
    m.avg_code_bits = average_code_length(table, freqs);

    auto bytes = encode_to_hcodec(data);
    m.container_bytes = bytes.size();
    m.payload_bytes = read_bitstream_header(bytes).payload_bytes;
    m.ratio_percent = 100.0 * static_cast<double>(m.payload_bytes) / static_cast<double>(m.original_bytes);
    m.roundtrip = decode_from_hcodec(bytes) == data;
    return m;
}

void write_csv_header(std::ostream& os) {
    os << "file,original_bytes,payload_bytes,container_bytes,ratio_percent,"
          "entropy_bits_per_symbol,avg_code_bits_per_symbol,roundtrip\n";
}

void write_csv_row(std::ostream& os, const std::string& file, const FileMetrics& m) {
    os << file << ","
       << m.original_bytes << ","
       << m.payload_bytes << ","
       << m.container_bytes << ","
       << m.ratio_percent << ","
       << m.entropy << ","
       << m.avg_code_bits << ","
       << (m.roundtrip ? "ok" : "mismatch") << "\n";
}

bool evaluate_files(const std::vector<std::string>& paths, std::ostream& csv, std::ostream& log) {
    write_csv_header(csv);
    bool all_ok = true;
    for (const std::string& path : paths) {
        auto data = read_all(path);
        if (data.empty()) {
            log << "[WARN] skipping empty file: " << path << "\n";
            continue;
        }
        FileMetrics m = evaluate_file(data);
        all_ok = all_ok && m.roundtrip;
        write_csv_row(csv, path, m);
        log << path << ": " << size_reduction_line(m.original_bytes, m.payload_bytes) << "\n";
    }
    return all_ok;
}

std::string size_reduction_line(uint64_t original_bytes, uint64_t payload_bytes) {
    const double pct = original_bytes == 0
        ? 0.0
        : 100.0 * static_cast<double>(payload_bytes) / static_cast<double>(original_bytes);
    char buf[96];
    std::snprintf(buf, sizeof(buf), "Size reduction: %llu => %llu (%.2f%%)",
                  static_cast<unsigned long long>(original_bytes),
                  static_cast<unsigned long long>(payload_bytes), pct);
    return buf;
}

void verify_hcodec(const std::vector<uint8_t>& data, const std::vector<uint8_t>& container) {
    if (decode_from_hcodec(container) != data) {
        throw std::runtime_error("verify: round-trip mismatch");
    }
}

} // namespace hcodec
