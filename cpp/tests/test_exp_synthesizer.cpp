#include <doctest/doctest.h>

#include "exp_synthesizer.hpp"
#include "test_tables.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace fixedexp;
using namespace fixedexp::testing;

namespace {

std::string write_temp(const std::string& name, const std::string& text) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << text;
    return path.string();
}

} // namespace

TEST_CASE("synthesizer rejects configurations before running") {
    SynthesisConfig cfg;

    SUBCASE("word wider than the decimal budget") {
        cfg.word_bits = 512;
        CHECK_NOTHROW(cfg.validate());
        CHECK_THROWS_AS(ExpSynthesizer{cfg}, ConfigurationError);
    }
    SUBCASE("inconsistent hi-term layout") {
        cfg.exp_max_hi_term_val = 200;
        CHECK_THROWS_AS(ExpSynthesizer{cfg}, ConfigurationError);
    }
    SUBCASE("guard digits swallow the budget") {
        cfg.guard_digits = 100;
        CHECK_THROWS_AS(ExpSynthesizer{cfg}, ConfigurationError);
    }
}

TEST_CASE("overflowing word surfaces from run") {
    SynthesisConfig cfg;
    cfg.word_bits = 140;
    ExpSynthesizer synth(cfg);
    CHECK_THROWS_AS(synth.run(), OverflowRiskError);
}

TEST_CASE("report carries the whole run") {
    const auto& r = default_tables();
    json::object report = r.to_json();

    CHECK(report.at("fixed_one").as_string() == "0x80000000000000000000000000000000");
    CHECK(report.at("max_val").as_string() == "0x3ffffffffffffffffffffffffffffffff");
    CHECK(report.at("config").as_object().at("precision").as_uint64() == 127);
    CHECK(report.at("hi_terms").as_array().size() == 7);
    CHECK(report.at("lo_terms").as_array().size() == 20);
    CHECK(report.at("lo_term_scores").as_array().size() == 20);
    CHECK(report.at("exp_at_max").as_string() == to_hex(r.at_max.value).c_str());
    CHECK(report.at("statements").as_array().size() == r.table.statements.size());

    const json::object& check = report.at("boundary_check").as_object();
    CHECK(check.at("passed").as_uint64() == 15);
    CHECK(check.at("skipped").as_array().size() == 1);

    const json::object& first = report.at("hi_terms").as_array()[0].as_object();
    CHECK(first.at("bit").as_string() == "0x10000000000000000000000000000000");
    CHECK(report.at("lo_terms").as_array()[0].as_object().at("ind").as_uint64() == 1);

    // the report is plain JSON text
    CHECK_NOTHROW(json::parse(json::serialize(report)));
}

TEST_CASE("config from JSON") {
    SUBCASE("missing keys keep their defaults") {
        SynthesisConfig cfg = SynthesisConfig::from_json(json::object{{"precision", 64}, {"word_bits", 128}});
        CHECK(cfg.precision == 64);
        CHECK(cfg.word_bits == 128);
        CHECK(cfg.exp_max_hi_term_val == 3);
        CHECK(cfg.exp_num_of_hi_terms == 6);
        CHECK(cfg.max_lo_terms == 64);
    }
    SUBCASE("round trip") {
        SynthesisConfig cfg;
        cfg.precision = 100;
        cfg.word_bits = 200;
        SynthesisConfig back = SynthesisConfig::from_json(cfg.to_json());
        CHECK(back.precision == 100);
        CHECK(back.word_bits == 200);
        CHECK(back.guard_digits == cfg.guard_digits);
    }
    SUBCASE("bad values") {
        CHECK_THROWS_AS(SynthesisConfig::from_json(json::object{{"precision", "127"}}), ConfigurationError);
        CHECK_THROWS_AS(SynthesisConfig::from_json(json::object{{"precision", -1}}), ConfigurationError);
        CHECK_THROWS_AS(SynthesisConfig::from_json(json::object{{"word_bits", 100}}), ConfigurationError);
    }
}

TEST_CASE("config files") {
    SUBCASE("valid file") {
        const std::string path = write_temp("fixedexp_config_ok.json", R"({"precision": 64, "word_bits": 128})");
        SynthesisConfig cfg = load_config(path);
        CHECK(cfg.precision == 64);
        std::remove(path.c_str());
    }
    SUBCASE("missing file") {
        CHECK_THROWS_AS(load_config("/nonexistent/fixedexp.json"), ConfigurationError);
    }
    SUBCASE("malformed JSON") {
        const std::string path = write_temp("fixedexp_config_bad.json", "{\"precision\": ");
        CHECK_THROWS_AS(load_config(path), ConfigurationError);
        std::remove(path.c_str());
    }
    SUBCASE("not an object") {
        const std::string path = write_temp("fixedexp_config_array.json", "[1, 2]");
        CHECK_THROWS_AS(load_config(path), ConfigurationError);
        std::remove(path.c_str());
    }
}
