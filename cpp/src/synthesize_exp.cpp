// Synthesizes the fixed-point exp table and prints the kernel body.
//
// Usage: synthesize_exp [config.json] [report.json]
//   config.json  overrides for precision / exp_max_hi_term_val / exp_num_of_hi_terms /
//                word_bits / max_lo_terms / guard_digits (defaults: 127 / 3 / 6 / 256 / 64 / 2)
//   report.json  full table, scores and emitted statements
// TRACE=1 prints every hi-term and lo-term candidate.
#include "exp_synthesizer.hpp"
#include <fstream>
#include <iostream>
#include <string>

using namespace fixedexp;

int main(int argc, char* argv[]) {
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [config.json] [report.json]" << std::endl;
        return 1;
    }

    try {
        SynthesisConfig config;
        if (argc >= 2) {
            config = load_config(argv[1]);
        }
        std::cerr << "Synthesizing exp table: precision=" << config.precision
                  << " max_hi_term_val=" << config.exp_max_hi_term_val
                  << " hi_terms=" << config.exp_num_of_hi_terms
                  << " word_bits=" << config.word_bits << std::endl;

        SynthesisResult result = ExpSynthesizer(config).run();

        std::cerr << "✓ " << result.hi_terms.size() << " hi-terms, "
                  << result.lo.terms.size() << " lo-terms, MAX_VAL=" << to_hex(result.max_val)
                  << std::endl;
        std::cerr << "✓ relative error at MAX_VAL "
                  << result.relative_error_at_max.str(6, std::ios_base::scientific)
                  << ", peak intermediate " << msb(result.at_max.peak) + 1 << " bits"
                  << std::endl;

        std::cout << result.table.render();

        if (argc == 3) {
            std::ofstream out_file(argv[2]);
            if (!out_file) {
                throw std::runtime_error(std::string("Cannot open output file: ") + argv[2]);
            }
            out_file << json::serialize(result.to_json()) << std::endl;
            std::cerr << "✓ Report written to " << argv[2] << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
