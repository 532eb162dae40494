#include "hi_term_table.hpp"
#include <cstdlib>
#include <iostream>

namespace fixedexp {

HiTermTableBuilder::HiTermTableBuilder(
    const SynthesisConfig& config,
    const DecimalContext<SynthesisReal>& ctx
) : config_(config), ctx_(ctx) {
    config_.validate();
    ctx_.require_bits(config_.word_bits, "word_max");
}

HiTerms HiTermTableBuilder::build() const {
    const bool trace = (std::getenv("TRACE") && std::string(std::getenv("TRACE")) == "1");

    const int max_hi = static_cast<int>(config_.exp_max_hi_term_val);
    const uint_t fixed_one = config_.fixed_one();
    const SynthesisReal word_max = ctx_.to_real(config_.word_max(), "word_max");
    const SynthesisReal one = ctx_.to_real(fixed_one, "FIXED_ONE");

    // Largest polynomial result before any hi-term is applied
    uint_t top = ctx_.floor_to_int(exp(ctx_.pow2(-max_hi)) * one, "top") - 1;

    HiTerms terms;
    terms.reserve(config_.exp_num_of_hi_terms + 1);
    for (unsigned n = 0; n <= config_.exp_num_of_hi_terms; ++n) {
        const SynthesisReal cur = exp(ctx_.pow2(static_cast<int>(n) - max_hi));
        const SynthesisReal bound = cur * ctx_.to_real(top, "top");

        uint_t den = ctx_.floor_to_int(word_max / bound, "den");
        if (den == 0) {
            throw OverflowRiskError(
                "hi-term " + std::to_string(n) + ": running bound leaves no room for a denominator");
        }
        uint_t num = ctx_.floor_to_int(ctx_.to_real(den, "den") * cur, "num");
        top = top * num / den;

        uint_t bit = (fixed_one << n) >> config_.exp_max_hi_term_val;
        if (trace) {
            std::cout << "TRACE hi_term n=" << n
                      << " bit=" << to_hex(bit)
                      << " num_bits=" << msb(num) + 1
                      << " den_bits=" << msb(den) + 1
                      << " top_bits=" << msb(top) + 1
                      << "\n";
        }
        terms.push_back({bit, num, den});
    }
    return terms;
}

uint_t max_input(const HiTerms& terms) {
    if (terms.empty()) {
        throw std::invalid_argument("max_input: empty hi-term table");
    }
    return terms.back().bit - 1;
}

} // namespace fixedexp
