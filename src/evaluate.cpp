// Evaluator: encode -> decode -> size and entropy metrics per input file.
#include "cli/cli_parser.hpp"
#include "codec/evaluation.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    try {
        hcodec::CliParser cli;
        cli.parse(argc, argv);
        const std::vector<std::string> inputs = cli.get_all("in");
        const std::string out_csv = cli.get("out");
        if (inputs.empty() || out_csv.empty()) {
            std::cerr << "Usage: hcodec_evaluate --in <file> [file ...] --out <metrics.csv>\n";
            return 1;
        }

        std::ofstream ofs(out_csv, std::ios::trunc);
        if (!ofs.good()) throw std::runtime_error("Cannot write csv: " + out_csv);
        const bool all_ok = hcodec::evaluate_files(inputs, ofs, std::cout);
        if (!ofs.good()) throw std::runtime_error("Cannot append csv: " + out_csv);

        std::cout << "Evaluation completed -> " << out_csv << "\n";
        return all_ok ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
