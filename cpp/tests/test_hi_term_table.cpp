#include <doctest/doctest.h>

#include "hi_term_table.hpp"
#include "test_tables.hpp"

using namespace fixedexp;
using fixedexp::testing::synthesis_context;

TEST_CASE("default hi-term table shape") {
    SynthesisConfig cfg;
    HiTerms hi = HiTermTableBuilder(cfg, synthesis_context()).build();
    const uint_t F = cfg.fixed_one();

    REQUIRE(hi.size() == 7);
    CHECK(hi.front().bit == uint_t(F >> 3));
    // the last bit equals FIXED_ONE * 2^3: the exclusive bound of [0, 2^3), never applied
    CHECK(hi.back().bit == uint_t(F << 3));
    CHECK(hi.back().bit > max_input(hi));
    CHECK(max_input(hi) == uint_t((F << 3) - 1));

    for (size_t n = 0; n < hi.size(); ++n) {
        CAPTURE(n);
        CHECK(hi[n].bit == uint_t((F << n) >> 3));
        if (n > 0) {
            CHECK(hi[n].bit > hi[n - 1].bit);
        }
        CHECK(hi[n].num > hi[n].den);
        CHECK(hi[n].den > 0);
        CHECK(hi[n].num <= cfg.word_max());
    }
}

TEST_CASE("hi-term ratios approach e^(2^(n-3)) from below") {
    SynthesisConfig cfg;
    auto ctx = synthesis_context();
    HiTerms hi = HiTermTableBuilder(cfg, ctx).build();

    for (size_t n = 0; n < hi.size(); ++n) {
        CAPTURE(n);
        const SynthesisReal expected = exp(ctx.pow2(static_cast<int>(n) - 3));
        const SynthesisReal ratio = SynthesisReal(hi[n].num) / SynthesisReal(hi[n].den);
        CHECK(ratio <= expected);
        // num is truncated, so the ratio is off by less than 1/den
        CHECK(SynthesisReal(expected - ratio) < SynthesisReal(1 / SynthesisReal(hi[n].den)));
    }
}

TEST_CASE("first hi-term matches the reference table") {
    HiTerms hi = HiTermTableBuilder(SynthesisConfig{}, synthesis_context()).build();
    CHECK(to_hex(hi[0].bit) == "0x10000000000000000000000000000000");
    CHECK(to_hex(hi[0].num) == "0x1c3d6a24ed82218787d624d3e5eba95f9");
    CHECK(to_hex(hi[0].den) == "0x18ebef9eac820ae8682b9793ac6d1e776");
}

TEST_CASE("composing every ratio stays within the word") {
    for (unsigned bits : {256u, 160u, 200u}) {
        CAPTURE(bits);
        SynthesisConfig cfg;
        cfg.word_bits = bits;
        auto ctx = synthesis_context();
        HiTerms hi = HiTermTableBuilder(cfg, ctx).build();

        // worst polynomial result, then every hi-term in order
        uint_t top = ctx.floor_to_int(exp(ctx.pow2(-3)) * SynthesisReal(cfg.fixed_one())) - 1;
        for (const auto& t : hi) {
            CHECK(uint_t(top * t.num) <= cfg.word_max());
            top = top * t.num / t.den;
        }
    }
}

TEST_CASE("narrow word runs out of room for the hi-terms") {
    SynthesisConfig cfg;
    cfg.exp_num_of_hi_terms = 5;
    cfg.word_bits = 130;
    CHECK_NOTHROW(cfg.validate());
    CHECK_THROWS_AS(HiTermTableBuilder(cfg, synthesis_context()).build(), OverflowRiskError);

    cfg.exp_num_of_hi_terms = 6;
    cfg.word_bits = 140;
    CHECK_THROWS_AS(HiTermTableBuilder(cfg, synthesis_context()).build(), OverflowRiskError);
}

TEST_CASE("configuration validation") {
    SynthesisConfig cfg;
    CHECK_NOTHROW(cfg.validate());

    SUBCASE("zero precision") {
        cfg.precision = 0;
        CHECK_THROWS_AS(cfg.validate(), ConfigurationError);
    }
    SUBCASE("word not wider than precision") {
        cfg.word_bits = 127;
        CHECK_THROWS_AS(cfg.validate(), ConfigurationError);
    }
    SUBCASE("hi-term shift beyond precision") {
        cfg.precision = 2;
        cfg.word_bits = 64;
        CHECK_THROWS_AS(cfg.validate(), ConfigurationError);
    }
    SUBCASE("no hi-terms") {
        cfg.exp_num_of_hi_terms = 0;
        CHECK_THROWS_AS(cfg.validate(), ConfigurationError);
    }
    SUBCASE("last bit outside the word") {
        cfg.word_bits = 130;
        CHECK_THROWS_AS(cfg.validate(), ConfigurationError);
    }
    SUBCASE("no lo-terms allowed") {
        cfg.max_lo_terms = 0;
        CHECK_THROWS_AS(cfg.validate(), ConfigurationError);
    }
    SUBCASE("builder validates too") {
        cfg.word_bits = 100;
        CHECK_THROWS_AS(HiTermTableBuilder(cfg, synthesis_context()), ConfigurationError);
    }
}

TEST_CASE("word wider than the decimal context is rejected") {
    SynthesisConfig cfg;
    cfg.word_bits = 512;
    CHECK_THROWS_AS(HiTermTableBuilder(cfg, synthesis_context()), ConfigurationError);
}

TEST_CASE("max_input needs a table") {
    CHECK_THROWS_AS(max_input(HiTerms{}), std::invalid_argument);
}
