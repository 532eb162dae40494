// Batch evaluation of the arbitrary-precision bonding formulas.
//
// Usage: oracle_harness <calls.json> <results.json>
//   calls.json   {"calls": [{"name": "...", "formula": "calculatePurchaseReturn",
//                            "args": ["1000000", "10000", "500000", "100"]}, ...]}
//
// Each call ends up in one of three states:
//   ok       value computed
//   skipped  arguments break the formula's preconditions (expected, counted)
//   failed   anything else: malformed call, digit budget exceeded, ... (reported,
//            and the process exits with status 1)
#include "formula_call.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>

using namespace fixedexp;

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <calls.json> <results.json>" << std::endl;
        return 1;
    }

    std::string calls_file = argv[1];
    std::string output_file = argv[2];
    CallTally tally;

    try {
        std::ifstream calls_stream(calls_file);
        if (!calls_stream) {
            throw std::runtime_error("Cannot open calls file: " + calls_file);
        }
        std::string calls_str((std::istreambuf_iterator<char>(calls_stream)),
                              std::istreambuf_iterator<char>());
        json::value calls_data = json::parse(calls_str);
        const json::array& calls = calls_data.as_object().at("calls").as_array();

        BondingFormula formula;
        json::array results;
        results.reserve(calls.size());
        for (size_t i = 0; i < calls.size(); ++i) {
            json::object r = process_call(formula, calls[i].as_object(), i);
            tally.record(r);
            if (r.at("status").as_string() == "failed") {
                std::cerr << "Call " << json::serialize(r.at("name"))
                          << " failed: " << r.at("error").as_string().c_str() << std::endl;
            }
            results.push_back(std::move(r));
        }

        json::object output;
        output["results"] = std::move(results);
        output["metadata"] = {
            {"calls_file", calls_file},
            {"digits10", std::numeric_limits<OracleReal>::digits10},
            {"total", tally.total()},
            {"ok", tally.ok},
            {"skipped", tally.skipped},
            {"failed", tally.failed}
        };

        std::ofstream out_file(output_file);
        if (!out_file) {
            throw std::runtime_error("Cannot open output file: " + output_file);
        }
        out_file << json::serialize(output) << std::endl;

        std::cout << "✓ " << tally.ok << " evaluated, " << tally.skipped << " skipped (domain), "
                  << tally.failed << " failed" << std::endl;
        std::cout << "✓ Results written to " << output_file << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return tally.failed == 0 ? 0 : 1;
}
