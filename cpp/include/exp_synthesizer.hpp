#ifndef FIXEDEXP_EXP_SYNTHESIZER_HPP
#define FIXEDEXP_EXP_SYNTHESIZER_HPP

#include "exp_evaluator.hpp"
#include "lo_term_search.hpp"
#include "synthesis_config.hpp"
#include "table_emitter.hpp"

namespace fixedexp {

struct SynthesisResult {
    SynthesisConfig config;
    HiTerms hi_terms;
    uint_t max_val;
    LoTermSearchResult lo;
    ExpEvaluation at_max;                 // kernel at MAX_VAL, with its peak intermediate
    SynthesisReal relative_error_at_max = 0;
    KernelCheckReport boundary_check;
    EmittedTable table;

    json::object to_json() const;
};

// One synthesis run: hi-terms, lo-term search, word-bound and boundary
// verification, emission.
class ExpSynthesizer {
public:
    explicit ExpSynthesizer(SynthesisConfig config);

    SynthesisResult run() const;

private:
    SynthesisConfig config_;
    DecimalContext<SynthesisReal> ctx_;
};

} // namespace fixedexp

#endif // FIXEDEXP_EXP_SYNTHESIZER_HPP
