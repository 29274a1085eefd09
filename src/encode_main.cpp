#include "cli/cli_parser.hpp"
#include "codec/encoder.hpp"
#include "codec/evaluation.hpp"
#include "entropy/bitstream.hpp"
#include "io/file_io.hpp"

#include <iostream>

int main(int argc, char** argv) {
    try {
        hcodec::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty()) {
            std::cout << "Usage: hcodec_encode --in <input> --out <output.hcodec> [--verify]\n";
            return 1;
        }

        auto data = hcodec::read_all(in);
        auto bytes = hcodec::encode_to_hcodec(data);
        if (cli.flag("verify")) {
            hcodec::verify_hcodec(data, bytes);
        }
        hcodec::write_all(out, bytes);

        const uint64_t payload_bytes = hcodec::read_bitstream_header(bytes).payload_bytes;
        std::cout << "input file size: " << data.size() << " bytes\n";
        std::cout << "Wrote: " << out << " (" << bytes.size() << " bytes)\n";
        std::cout << hcodec::size_reduction_line(data.size(), payload_bytes) << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
