#ifndef FIXEDEXP_SYNTHESIS_CONFIG_HPP
#define FIXEDEXP_SYNTHESIS_CONFIG_HPP

#include "fixedexp_types.hpp"
#include <boost/json.hpp>
#include <string>

namespace fixedexp {

namespace json = boost::json;

// Constants of one synthesis run. Never mutated once the run starts.
struct SynthesisConfig {
    unsigned precision = 127;           // fractional bits, FIXED_ONE = 2^precision
    unsigned exp_max_hi_term_val = 3;   // kernel input must be below 2^exp_max_hi_term_val
    unsigned exp_num_of_hi_terms = 6;   // hi-terms for e^(2^(n - exp_max_hi_term_val)), n = 0..N
    unsigned word_bits = 256;           // target integer width
    unsigned max_lo_terms = 64;         // cap on the lo-term search
    unsigned guard_digits = 2;          // decimal digits kept after the point

    uint_t fixed_one() const { return uint_t(1) << precision; }
    uint_t word_max() const { return (uint_t(1) << word_bits) - 1; }

    // Throws ConfigurationError describing the first bad field
    void validate() const;

    json::object to_json() const;
    static SynthesisConfig from_json(const json::object& obj);
};

// Reads a JSON object of overrides; missing keys keep their defaults
SynthesisConfig load_config(const std::string& path);

} // namespace fixedexp

#endif // FIXEDEXP_SYNTHESIS_CONFIG_HPP
