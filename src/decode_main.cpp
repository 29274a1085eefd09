#include "cli/cli_parser.hpp"
#include "codec/decoder.hpp"
#include "io/file_io.hpp"

#include <iostream>

int main(int argc, char** argv) {
    try {
        hcodec::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty()) {
            std::cerr << "Usage: hcodec_decode --in <input.hcodec> --out <output>\n";
            return 1;
        }

        auto bytes = hcodec::read_all(in);
        auto data = hcodec::decode_from_hcodec(bytes);
        hcodec::write_all(out, data);
        std::cout << "Wrote: " << out << " (" << data.size() << " bytes)\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
