#include "exp_synthesizer.hpp"
#include "hi_term_table.hpp"
#include <utility>

namespace fixedexp {

namespace {

std::string real_to_str(const SynthesisReal& v) {
    return v.str(12, std::ios_base::scientific);
}

} // namespace

ExpSynthesizer::ExpSynthesizer(SynthesisConfig config)
    : config_(std::move(config)), ctx_(config_.guard_digits) {
    config_.validate();
    // All decimal work happens below the word maximum
    ctx_.require_bits(config_.word_bits, "word_max");
}

SynthesisResult ExpSynthesizer::run() const {
    SynthesisResult result;
    result.config = config_;

    result.hi_terms = HiTermTableBuilder(config_, ctx_).build();
    result.max_val = max_input(result.hi_terms);

    const uint_t fixed_one = config_.fixed_one();
    ExpOracle oracle(fixed_one, ctx_);
    result.lo = LoTermSearch(result.hi_terms, fixed_one, oracle, config_.max_lo_terms).run();

    FixedPointExpEvaluator kernel(result.hi_terms, result.lo.terms, fixed_one);
    // Every intermediate grows with both the remainder and the set bits, so
    // MAX_VAL (all bits set) carries the largest one
    result.at_max = kernel.evaluate(result.max_val);
    if (result.at_max.peak > config_.word_max()) {
        throw OverflowRiskError(
            "kernel intermediate " + to_hex(result.at_max.peak) + " exceeds the "
            + std::to_string(config_.word_bits) + "-bit word");
    }
    result.relative_error_at_max = oracle.relative_error(result.at_max.value, result.max_val);

    result.boundary_check = check_kernel(kernel, oracle, boundary_probes(result.hi_terms));
    if (!result.boundary_check.ok()) {
        const auto& m = result.boundary_check.mismatches.front();
        throw std::runtime_error(
            "kernel exceeds its error bound at " + to_hex(m.input)
            + ": relative error " + real_to_str(m.relative_error));
    }

    result.table = TableEmitter::emit(result.hi_terms, result.lo.terms);
    return result;
}

json::object SynthesisResult::to_json() const {
    json::object obj;
    obj["config"] = config.to_json();
    obj["fixed_one"] = to_hex(config.fixed_one());
    obj["max_val"] = to_hex(max_val);

    json::array hi;
    for (const auto& t : hi_terms) {
        hi.push_back(json::object{{"bit", to_hex(t.bit)}, {"num", to_hex(t.num)}, {"den", to_hex(t.den)}});
    }
    obj["hi_terms"] = std::move(hi);

    json::array lo_arr;
    for (const auto& t : lo.terms) {
        lo_arr.push_back(json::object{{"val", to_hex(t.val)}, {"ind", t.ind}});
    }
    obj["lo_terms"] = std::move(lo_arr);

    json::array scores;
    for (const auto& s : lo.history) {
        scores.push_back(json::object{{"error", s.error.str()}, {"bits", s.bits}});
    }
    obj["lo_term_scores"] = std::move(scores);
    obj["lo_term_rejected"] = json::object{{"error", lo.rejected.error.str()}, {"bits", lo.rejected.bits}};

    obj["exp_at_max"] = to_hex(at_max.value);
    obj["peak_intermediate"] = to_hex(at_max.peak);
    obj["relative_error_at_max"] = real_to_str(relative_error_at_max);

    json::array skipped;
    for (const auto& x : boundary_check.skipped) {
        skipped.push_back(json::value(to_hex(x)));
    }
    obj["boundary_check"] = json::object{
        {"passed", boundary_check.passed},
        {"skipped", std::move(skipped)},
        {"worst_relative_error", real_to_str(boundary_check.worst_relative_error)}
    };

    json::array statements;
    for (const auto& s : table.statements) {
        statements.push_back(json::value(s));
    }
    obj["statements"] = std::move(statements);
    return obj;
}

} // namespace fixedexp
