// Shared tables for the kernel tests: one synthesis per configuration.
#pragma once

#include "exp_synthesizer.hpp"

namespace fixedexp {
namespace testing {

// precision 127, hi-terms for e^(2^(n-3)), n = 0..6, 256-bit word
inline const SynthesisResult& default_tables() {
    static const SynthesisResult result = ExpSynthesizer(SynthesisConfig{}).run();
    return result;
}

// Same shape on a 128-bit word with 64 fractional bits
inline const SynthesisResult& narrow_tables() {
    static const SynthesisResult result = [] {
        SynthesisConfig cfg;
        cfg.precision = 64;
        cfg.word_bits = 128;
        return ExpSynthesizer(cfg).run();
    }();
    return result;
}

inline DecimalContext<SynthesisReal> synthesis_context() {
    return DecimalContext<SynthesisReal>(2);
}

} // namespace testing
} // namespace fixedexp
