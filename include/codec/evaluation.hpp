#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace hcodec {

struct FileMetrics {
    uint64_t original_bytes = 0;
    uint64_t payload_bytes = 0;
    uint64_t container_bytes = 0;
    double ratio_percent = 0.0;   // 100 * payload / original
    double entropy = 0.0;         // bits per symbol
    double avg_code_bits = 0.0;   // bits per symbol, end-of-input excluded
    bool roundtrip = false;
};

// Encode -> decode -> metrics. Throws EmptyInputError on empty data.
FileMetrics evaluate_file(const std::vector<uint8_t>& data);

void write_csv_header(std::ostream& os);
void write_csv_row(std::ostream& os, const std::string& file, const FileMetrics& m);

// Evaluates every path into csv, one row per non-empty file. Empty files are
// reported on log and skipped. Returns false if any round-trip mismatched.
bool evaluate_files(const std::vector<std::string>& paths, std::ostream& csv, std::ostream& log);

// "Size reduction: <original> => <payload> (<pct>%)", pct with two decimals.
std::string size_reduction_line(uint64_t original_bytes, uint64_t payload_bytes);

// Decodes container and throws std::runtime_error unless it yields data.
void verify_hcodec(const std::vector<uint8_t>& data, const std::vector<uint8_t>& container);

} // namespace hcodec
