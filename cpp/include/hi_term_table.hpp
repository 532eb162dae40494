#ifndef FIXEDEXP_HI_TERM_TABLE_HPP
#define FIXEDEXP_HI_TERM_TABLE_HPP

#include "decimal_context.hpp"
#include "synthesis_config.hpp"

namespace fixedexp {

/**
 * Builds the hi-term table: entry n holds bit = FIXED_ONE * 2^(n - M) and a
 * ratio num/den just below e^(2^(n - M)), for n = 0..N.
 *
 * A running bound tracks the worst-case product of every ratio chosen so far
 * (starting from the largest polynomial result, e^(2^-M) * FIXED_ONE), and
 * each den is the largest integer keeping den * e^(...) * bound within the
 * word. Composing any subset of the ratios therefore never overflows.
 * The last entry is a sentinel whose bit bounds the kernel input.
 */
class HiTermTableBuilder {
public:
    HiTermTableBuilder(const SynthesisConfig& config, const DecimalContext<SynthesisReal>& ctx);

    HiTerms build() const;

private:
    SynthesisConfig config_;
    DecimalContext<SynthesisReal> ctx_;
};

// Largest valid kernel input: last bit - 1
uint_t max_input(const HiTerms& terms);

} // namespace fixedexp

#endif // FIXEDEXP_HI_TERM_TABLE_HPP
