#ifndef FIXEDEXP_LO_TERM_SEARCH_HPP
#define FIXEDEXP_LO_TERM_SEARCH_HPP

#include "exp_evaluator.hpp"
#include <vector>

namespace fixedexp {

struct LoTermSearchResult {
    LoTerms terms;
    std::vector<PrecisionScore> history;  // one per accepted candidate, strictly improving
    PrecisionScore rejected;              // the first candidate that did not improve
};

/**
 * Greedy search for the Taylor term count of e^y - 1 - y.
 *
 * Candidates grow one term at a time and are scored at the largest kernel
 * input. The search keeps the last candidate that strictly reduced the error
 * and stops at the first one that does not. This only shows that one more
 * term does not help at that input. A search still improving past
 * max_terms throws NonConvergenceError.
 */
class LoTermSearch {
public:
    LoTermSearch(HiTerms hi_terms, uint_t fixed_one, ExpOracle oracle, unsigned max_terms);

    LoTermSearchResult run() const;

    // n terms: {n! / (i+1)!, i+1} for i = 0..n-1
    static LoTerms candidate(unsigned n);

private:
    PrecisionScore score(const LoTerms& terms) const;

    HiTerms hi_terms_;
    uint_t fixed_one_;
    uint_t max_val_;
    ExpOracle oracle_;
    unsigned max_terms_;
};

} // namespace fixedexp

#endif // FIXEDEXP_LO_TERM_SEARCH_HPP
