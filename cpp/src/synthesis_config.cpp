#include "synthesis_config.hpp"
// Header-only Boost.JSON: the implementation is compiled into this unit only
#include <boost/json/src.hpp>
#include <cstdint>
#include <fstream>
#include <iterator>

namespace fixedexp {

namespace {

unsigned read_unsigned(const json::object& obj, const char* key, unsigned fallback) {
    const json::value* v = obj.if_contains(key);
    if (!v) {
        return fallback;
    }
    if (!v->is_int64() && !v->is_uint64()) {
        throw ConfigurationError(std::string("config: '") + key + "' must be an integer");
    }
    int64_t n = v->is_int64() ? v->as_int64() : static_cast<int64_t>(v->as_uint64());
    if (n < 0 || n > 1 << 16) {
        throw ConfigurationError(std::string("config: '") + key + "' out of range");
    }
    return static_cast<unsigned>(n);
}

} // namespace

void SynthesisConfig::validate() const {
    if (precision == 0) {
        throw ConfigurationError("config: precision must be positive");
    }
    if (word_bits <= precision) {
        throw ConfigurationError("config: word_bits must exceed precision");
    }
    // The first hi-term bit is FIXED_ONE >> exp_max_hi_term_val and must not vanish
    if (exp_max_hi_term_val > precision) {
        throw ConfigurationError("config: exp_max_hi_term_val exceeds precision");
    }
    if (exp_num_of_hi_terms == 0) {
        throw ConfigurationError("config: exp_num_of_hi_terms must be positive");
    }
    if (precision + exp_num_of_hi_terms >= word_bits + exp_max_hi_term_val) {
        throw ConfigurationError("config: largest hi-term bit does not fit the word");
    }
    if (max_lo_terms == 0) {
        throw ConfigurationError("config: max_lo_terms must be positive");
    }
}

json::object SynthesisConfig::to_json() const {
    json::object obj;
    obj["precision"] = precision;
    obj["exp_max_hi_term_val"] = exp_max_hi_term_val;
    obj["exp_num_of_hi_terms"] = exp_num_of_hi_terms;
    obj["word_bits"] = word_bits;
    obj["max_lo_terms"] = max_lo_terms;
    obj["guard_digits"] = guard_digits;
    return obj;
}

SynthesisConfig SynthesisConfig::from_json(const json::object& obj) {
    SynthesisConfig cfg;
    cfg.precision = read_unsigned(obj, "precision", cfg.precision);
    cfg.exp_max_hi_term_val = read_unsigned(obj, "exp_max_hi_term_val", cfg.exp_max_hi_term_val);
    cfg.exp_num_of_hi_terms = read_unsigned(obj, "exp_num_of_hi_terms", cfg.exp_num_of_hi_terms);
    cfg.word_bits = read_unsigned(obj, "word_bits", cfg.word_bits);
    cfg.max_lo_terms = read_unsigned(obj, "max_lo_terms", cfg.max_lo_terms);
    cfg.guard_digits = read_unsigned(obj, "guard_digits", cfg.guard_digits);
    cfg.validate();
    return cfg;
}

SynthesisConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Cannot open config file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    json::error_code ec;
    json::value data = json::parse(text, ec);
    if (ec) {
        throw ConfigurationError("config: " + path + ": " + ec.message());
    }
    if (!data.is_object()) {
        throw ConfigurationError("config: " + path + ": top level must be an object");
    }
    return SynthesisConfig::from_json(data.as_object());
}

} // namespace fixedexp
