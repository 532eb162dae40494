#ifndef FIXEDEXP_EXP_EVALUATOR_HPP
#define FIXEDEXP_EXP_EVALUATOR_HPP

#include "decimal_context.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace fixedexp {

struct ExpEvaluation {
    uint_t value;
    uint_t peak;  // largest intermediate product the kernel forms
};

/**
 * Integer-only e^(x / FIXED_ONE) * FIXED_ONE over a (hi-term, lo-term) table.
 *
 * This is exactly the arithmetic the emitted kernel performs:
 *   z = y = x % hi[0].bit
 *   z = z * y / FIXED_ONE; res += z * lo[i].val     for i >= 1
 *   res = res / lo[0].val + y + FIXED_ONE
 *   res = res * hi[j].num / hi[j].den               for every set bit hi[j].bit
 * The last hi-term is never applied; its bit is the exclusive input bound.
 */
class FixedPointExpEvaluator {
public:
    FixedPointExpEvaluator(HiTerms hi_terms, LoTerms lo_terms, uint_t fixed_one);

    // Throws KernelDomainError unless x < last hi-term bit
    uint_t exp(const uint_t& x) const;
    ExpEvaluation evaluate(const uint_t& x) const;

    bool in_domain(const uint_t& x) const { return x < hi_terms_.back().bit; }
    uint_t max_val() const { return hi_terms_.back().bit - 1; }
    const uint_t& fixed_one() const { return fixed_one_; }
    const HiTerms& hi_terms() const { return hi_terms_; }
    const LoTerms& lo_terms() const { return lo_terms_; }

private:
    HiTerms hi_terms_;
    LoTerms lo_terms_;
    uint_t fixed_one_;
};

// Absolute error against the exact value, and how many leading bits agree
struct PrecisionScore {
    uint_t error;
    unsigned bits = 0;

    bool improves_on(const PrecisionScore& other) const { return error < other.error; }
};

/**
 * Arbitrary-precision reference for the kernel: e^(x / FIXED_ONE) * FIXED_ONE.
 */
class ExpOracle {
public:
    ExpOracle(uint_t fixed_one, const DecimalContext<SynthesisReal>& ctx);

    SynthesisReal exact(const uint_t& x) const;
    uint_t exact_floor(const uint_t& x) const;

    PrecisionScore score(const uint_t& approx, const uint_t& x) const;
    SynthesisReal relative_error(const uint_t& approx, const uint_t& x) const;

    // Worst-case relative error of the kernel at x: 1/num for every applied
    // hi-term (num is truncated) plus one unit of FIXED_ONE per truncating
    // division (every lo-term, every hi-term, and two for the final sum).
    SynthesisReal error_bound(const FixedPointExpEvaluator& kernel, const uint_t& x) const;

private:
    uint_t fixed_one_;
    DecimalContext<SynthesisReal> ctx_;
};

struct KernelMismatch {
    uint_t input;
    uint_t value;
    SynthesisReal relative_error;
};

struct KernelCheckReport {
    size_t passed = 0;
    std::vector<uint_t> skipped;  // outside the kernel domain
    std::vector<KernelMismatch> mismatches;
    SynthesisReal worst_relative_error = 0;

    bool ok() const { return mismatches.empty(); }
};

// Compares the kernel with the oracle on each input. Inputs the kernel rejects
// as out of domain are skipped; anything else that misses the tolerance is a
// mismatch. Other failures propagate.
KernelCheckReport check_kernel(
    const FixedPointExpEvaluator& kernel,
    const ExpOracle& oracle,
    const std::vector<uint_t>& inputs,
    const SynthesisReal& tolerance
);

// Same, with ExpOracle::error_bound as the per-input tolerance
KernelCheckReport check_kernel(
    const FixedPointExpEvaluator& kernel,
    const ExpOracle& oracle,
    const std::vector<uint_t>& inputs
);

// 0, 1, and both sides of every hi-term bit (the last bit is out of domain)
std::vector<uint_t> boundary_probes(const HiTerms& hi_terms);

} // namespace fixedexp

#endif // FIXEDEXP_EXP_EVALUATOR_HPP
