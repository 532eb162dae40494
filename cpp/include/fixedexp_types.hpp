#ifndef FIXEDEXP_TYPES_HPP
#define FIXEDEXP_TYPES_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace fixedexp {

// Exact integers of any width; the target word width is a run parameter.
using uint_t = boost::multiprecision::cpp_int;

// 78 digits cover 2^256-1, plus 2 digits after the decimal point
using OracleReal = boost::multiprecision::number<boost::multiprecision::cpp_dec_float<80>>;
// Synthesis needs headroom above the word for the den/num quotients
using SynthesisReal = boost::multiprecision::number<boost::multiprecision::cpp_dec_float<100>>;

struct HiTerm {
    uint_t bit;
    uint_t num;
    uint_t den;
};

struct LoTerm {
    uint_t val;
    unsigned ind;
};

using HiTerms = std::vector<HiTerm>;
using LoTerms = std::vector<LoTerm>;

// ------------------------------- Errors --------------------------------------

// Digit budget too small for a magnitude, or an unusable configuration.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// A table that could overflow the target word.
class OverflowRiskError : public std::overflow_error {
public:
    explicit OverflowRiskError(const std::string& what) : std::overflow_error(what) {}
};

// Lo-term search still improving at the configured cap.
class NonConvergenceError : public std::runtime_error {
public:
    explicit NonConvergenceError(const std::string& what) : std::runtime_error(what) {}
};

// Kernel input outside [0, last hi-term bit).
class KernelDomainError : public std::domain_error {
public:
    explicit KernelDomainError(const std::string& what) : std::domain_error(what) {}
};

inline std::string to_hex(const uint_t& value) {
    return "0x" + value.str(0, std::ios_base::hex);
}

} // namespace fixedexp

#endif // FIXEDEXP_TYPES_HPP
