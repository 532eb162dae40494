#include "exp_evaluator.hpp"
#include <boost/math/special_functions/relative_difference.hpp>
#include <stdexcept>
#include <utility>

namespace fixedexp {

// ----------------------------- FixedPointExpEvaluator ------------------------

FixedPointExpEvaluator::FixedPointExpEvaluator(HiTerms hi_terms, LoTerms lo_terms, uint_t fixed_one)
    : hi_terms_(std::move(hi_terms)), lo_terms_(std::move(lo_terms)), fixed_one_(std::move(fixed_one)) {
    if (hi_terms_.empty()) {
        throw std::invalid_argument("evaluator: no hi-terms");
    }
    if (lo_terms_.empty() || lo_terms_[0].val == 0) {
        throw std::invalid_argument("evaluator: lo-terms need a nonzero scale entry");
    }
    if (hi_terms_[0].bit == 0 || fixed_one_ == 0) {
        throw std::invalid_argument("evaluator: zero modulus");
    }
}

uint_t FixedPointExpEvaluator::exp(const uint_t& x) const {
    return evaluate(x).value;
}

ExpEvaluation FixedPointExpEvaluator::evaluate(const uint_t& x) const {
    if (!in_domain(x)) {
        throw KernelDomainError("exp: input " + to_hex(x) + " not below " + to_hex(hi_terms_.back().bit));
    }

    uint_t peak = 0;
    uint_t res = 0;
    uint_t y = x % hi_terms_[0].bit;
    uint_t z = y;

    // y^i * (n! / i!), accumulated in the scale of n!
    for (size_t i = 1; i < lo_terms_.size(); ++i) {
        z = z * y;
        if (z > peak) peak = z;
        z /= fixed_one_;
        uint_t term = z * lo_terms_[i].val;
        if (term > peak) peak = term;
        res += term;
        if (res > peak) peak = res;
    }
    res = res / lo_terms_[0].val + y + fixed_one_;
    if (res > peak) peak = res;

    for (size_t j = 0; j + 1 < hi_terms_.size(); ++j) {
        if ((x & hi_terms_[j].bit) != 0) {
            res = res * hi_terms_[j].num;
            if (res > peak) peak = res;
            res /= hi_terms_[j].den;
        }
    }
    return {res, peak};
}

// ---------------------------------- ExpOracle --------------------------------

ExpOracle::ExpOracle(uint_t fixed_one, const DecimalContext<SynthesisReal>& ctx)
    : fixed_one_(std::move(fixed_one)), ctx_(ctx) {}

SynthesisReal ExpOracle::exact(const uint_t& x) const {
    const SynthesisReal one = ctx_.to_real(fixed_one_, "FIXED_ONE");
    const SynthesisReal xr = ctx_.to_real(x, "x");
    return SynthesisReal(boost::multiprecision::exp(xr / one)) * one;
}

uint_t ExpOracle::exact_floor(const uint_t& x) const {
    return ctx_.floor_to_int(exact(x), "e^x");
}

PrecisionScore ExpOracle::score(const uint_t& approx, const uint_t& x) const {
    const uint_t expected = exact_floor(x);
    PrecisionScore s;
    s.error = approx > expected ? uint_t(approx - expected) : uint_t(expected - approx);
    const unsigned width = msb(expected) + 1;
    if (s.error == 0) {
        s.bits = width;
    } else {
        const unsigned err_width = msb(s.error) + 1;
        s.bits = err_width < width ? width - err_width : 0;
    }
    return s;
}

SynthesisReal ExpOracle::relative_error(const uint_t& approx, const uint_t& x) const {
    return boost::math::relative_difference(ctx_.to_real(approx, "approx"), exact(x));
}

SynthesisReal ExpOracle::error_bound(const FixedPointExpEvaluator& kernel, const uint_t& x) const {
    const HiTerms& hi = kernel.hi_terms();
    SynthesisReal bound = 0;
    size_t divisions = kernel.lo_terms().size() + 1;
    for (size_t j = 0; j + 1 < hi.size(); ++j) {
        if ((x & hi[j].bit) != 0) {
            bound += 1 / ctx_.to_real(hi[j].num, "num");
            ++divisions;
        }
    }
    bound += SynthesisReal(divisions) / ctx_.to_real(fixed_one_, "FIXED_ONE");
    return bound;
}

// --------------------------------- Kernel checks -----------------------------

namespace {

template <typename Tolerance>
KernelCheckReport check_kernel_with(
    const FixedPointExpEvaluator& kernel,
    const ExpOracle& oracle,
    const std::vector<uint_t>& inputs,
    Tolerance tolerance
) {
    KernelCheckReport report;
    for (const auto& x : inputs) {
        if (!kernel.in_domain(x)) {
            report.skipped.push_back(x);
            continue;
        }
        uint_t value = kernel.exp(x);
        SynthesisReal err = oracle.relative_error(value, x);
        if (err > report.worst_relative_error) {
            report.worst_relative_error = err;
        }
        if (err > tolerance(x)) {
            report.mismatches.push_back({x, value, err});
        } else {
            ++report.passed;
        }
    }
    return report;
}

} // namespace

KernelCheckReport check_kernel(
    const FixedPointExpEvaluator& kernel,
    const ExpOracle& oracle,
    const std::vector<uint_t>& inputs,
    const SynthesisReal& tolerance
) {
    return check_kernel_with(kernel, oracle, inputs, [&](const uint_t&) { return tolerance; });
}

KernelCheckReport check_kernel(
    const FixedPointExpEvaluator& kernel,
    const ExpOracle& oracle,
    const std::vector<uint_t>& inputs
) {
    return check_kernel_with(kernel, oracle, inputs, [&](const uint_t& x) {
        return oracle.error_bound(kernel, x);
    });
}

std::vector<uint_t> boundary_probes(const HiTerms& hi_terms) {
    std::vector<uint_t> probes{uint_t(0), uint_t(1)};
    for (const auto& term : hi_terms) {
        if (term.bit > 1) {
            probes.push_back(term.bit - 1);
        }
        probes.push_back(term.bit);
    }
    return probes;
}

} // namespace fixedexp
