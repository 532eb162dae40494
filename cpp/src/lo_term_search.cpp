#include "lo_term_search.hpp"
#include "hi_term_table.hpp"
#include <cstdlib>
#include <iostream>
#include <utility>

namespace fixedexp {

LoTermSearch::LoTermSearch(HiTerms hi_terms, uint_t fixed_one, ExpOracle oracle, unsigned max_terms)
    : hi_terms_(std::move(hi_terms)),
      fixed_one_(std::move(fixed_one)),
      max_val_(max_input(hi_terms_)),
      oracle_(std::move(oracle)),
      max_terms_(max_terms) {
    if (max_terms_ == 0) {
        throw ConfigurationError("lo-term search: max_terms must be positive");
    }
}

LoTerms LoTermSearch::candidate(unsigned n) {
    if (n == 0) {
        throw std::invalid_argument("lo-term candidate needs at least one term");
    }
    // factorials[k] = k!
    std::vector<uint_t> factorials(n + 1, uint_t(1));
    for (unsigned k = 1; k <= n; ++k) {
        factorials[k] = factorials[k - 1] * k;
    }
    LoTerms terms;
    terms.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
        terms.push_back({factorials[n] / factorials[i + 1], i + 1});
    }
    return terms;
}

PrecisionScore LoTermSearch::score(const LoTerms& terms) const {
    FixedPointExpEvaluator kernel(hi_terms_, terms, fixed_one_);
    return oracle_.score(kernel.exp(max_val_), max_val_);
}

LoTermSearchResult LoTermSearch::run() const {
    const bool trace = (std::getenv("TRACE") && std::string(std::getenv("TRACE")) == "1");

    LoTermSearchResult result;
    result.terms = candidate(1);
    result.history.push_back(score(result.terms));

    for (unsigned n = 2;; ++n) {
        if (n > max_terms_) {
            throw NonConvergenceError(
                "lo-term search still improving at " + std::to_string(max_terms_) + " terms");
        }
        LoTerms next = candidate(n);
        PrecisionScore s = score(next);
        if (trace) {
            std::cout << "TRACE lo_term n=" << n
                      << " error=" << s.error
                      << " bits=" << s.bits
                      << "\n";
        }
        if (!s.improves_on(result.history.back())) {
            result.rejected = s;
            break;
        }
        result.terms = std::move(next);
        result.history.push_back(s);
    }
    return result;
}

} // namespace fixedexp
