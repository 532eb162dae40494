#include "formula_call.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace fixedexp {

namespace {

struct FormulaInfo {
    Formula formula;
    const char* name;
    const char* alias;
    size_t arity;
};

const FormulaInfo FORMULAS[] = {
    {Formula::PurchaseReturn,     "calculatePurchaseReturn",     "purchase_return",      4},
    {Formula::SaleReturn,         "calculateSaleReturn",         "sale_return",          4},
    {Formula::CrossReserveReturn, "calculateCrossReserveReturn", "cross_reserve_return", 5},
    {Formula::FundCost,           "calculateFundCost",           "fund_cost",            4},
    {Formula::FundReturn,         "calculateFundReturn",         "fund_return",          4},
    {Formula::LiquidateReturn,    "calculateLiquidateReturn",    "liquidate_return",     4},
    {Formula::Power,              "power",                       "power",                5},
};

const FormulaInfo& info(Formula f) {
    for (const auto& fi : FORMULAS) {
        if (fi.formula == f) return fi;
    }
    throw std::invalid_argument("unknown formula");
}

// Fund and liquidate take the sum of all reserve ratios, up to twice the maximum
const uint_t MAX_RATIO = BondingFormula::MAX_RATIO();
const uint_t MAX_RATIOS = 2 * BondingFormula::MAX_RATIO();

bool ratio_ok(const uint_t& r, const uint_t& max) {
    return r > 0 && r <= max;
}

uint_t parse_arg(const json::value& v) {
    if (v.is_string()) {
        const json::string& s = v.as_string();
        // optional leading minus, then digits only
        const auto digits = s.begin() + (!s.empty() && s[0] == '-' ? 1 : 0);
        if (digits == s.end() || !std::all_of(digits, s.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c)) != 0;
            })) {
            throw std::invalid_argument("argument is not a decimal integer: " + std::string(s.c_str()));
        }
        // a leading 0 would make cpp_int read octal
        std::string text(digits, s.end());
        text.erase(0, std::min(text.find_first_not_of('0'), text.size() - 1));
        const uint_t value(text);
        return digits != s.begin() ? uint_t(-value) : value;
    }
    if (v.is_int64()) return uint_t(v.as_int64());
    if (v.is_uint64()) return uint_t(v.as_uint64());
    throw std::invalid_argument("argument must be an integer or a decimal string");
}

} // namespace

Formula parse_formula(const std::string& name) {
    for (const auto& fi : FORMULAS) {
        if (name == fi.name || name == fi.alias) return fi.formula;
    }
    throw std::invalid_argument("unknown formula: " + name);
}

const char* formula_name(Formula f) {
    return info(f).name;
}

size_t formula_arity(Formula f) {
    return info(f).arity;
}

FormulaCall FormulaCall::from_json(const json::object& obj) {
    FormulaCall call;
    call.formula = parse_formula(obj.at("formula").as_string().c_str());
    for (const auto& v : obj.at("args").as_array()) {
        call.args.push_back(parse_arg(v));
    }
    if (call.args.size() != formula_arity(call.formula)) {
        throw std::invalid_argument(
            std::string(formula_name(call.formula)) + " takes "
            + std::to_string(formula_arity(call.formula)) + " arguments");
    }
    return call;
}

std::optional<std::string> domain_violation(const FormulaCall& call) {
    const auto& a = call.args;
    if (a.size() != formula_arity(call.formula)) {
        return std::string("wrong number of arguments");
    }
    for (const auto& v : a) {
        if (v < 0) return std::string("negative argument");
    }

    switch (call.formula) {
    case Formula::PurchaseReturn:
        // supply, balance, ratio, amount
        if (a[1] == 0) return std::string("balance must be positive");
        if (!ratio_ok(a[2], MAX_RATIO)) return std::string("ratio must be in (0, 1000000]");
        break;
    case Formula::SaleReturn:
        if (a[0] == 0) return std::string("supply must be positive");
        if (!ratio_ok(a[2], MAX_RATIO)) return std::string("ratio must be in (0, 1000000]");
        if (a[3] > a[0]) return std::string("amount exceeds supply");
        break;
    case Formula::CrossReserveReturn:
        // balance1, ratio1, balance2, ratio2, amount
        if (a[0] == 0 || a[2] == 0) return std::string("balances must be positive");
        if (!ratio_ok(a[1], MAX_RATIO) || !ratio_ok(a[3], MAX_RATIO)) {
            return std::string("ratios must be in (0, 1000000]");
        }
        break;
    case Formula::FundCost:
    case Formula::FundReturn:
        // supply, balance, ratios, amount
        if (a[0] == 0) return std::string("supply must be positive");
        if (!ratio_ok(a[2], MAX_RATIOS)) return std::string("ratios must be in (0, 2000000]");
        break;
    case Formula::LiquidateReturn:
        if (a[0] == 0) return std::string("supply must be positive");
        if (!ratio_ok(a[2], MAX_RATIOS)) return std::string("ratios must be in (0, 2000000]");
        // the base supply / (supply - amount) has a pole at amount == supply
        if (a[3] >= a[0]) return std::string("amount must be below supply");
        break;
    case Formula::Power:
        // baseN, baseD, expN, expD, precision
        if (a[1] == 0) return std::string("baseD must be positive");
        if (a[3] == 0) return std::string("expD must be positive");
        break;
    }
    return std::nullopt;
}

OracleReal evaluate(const BondingFormula& formula, const FormulaCall& call) {
    const auto& a = call.args;
    if (a.size() != formula_arity(call.formula)) {
        throw std::invalid_argument(
            std::string(formula_name(call.formula)) + ": wrong number of arguments");
    }

    switch (call.formula) {
    case Formula::PurchaseReturn:
        return formula.calculate_purchase_return(a[0], a[1], a[2], a[3]);
    case Formula::SaleReturn:
        return formula.calculate_sale_return(a[0], a[1], a[2], a[3]);
    case Formula::CrossReserveReturn:
        return formula.calculate_cross_reserve_return(a[0], a[1], a[2], a[3], a[4]);
    case Formula::FundCost:
        return formula.calculate_fund_cost(a[0], a[1], a[2], a[3]);
    case Formula::FundReturn:
        return formula.calculate_fund_return(a[0], a[1], a[2], a[3]);
    case Formula::LiquidateReturn:
        return formula.calculate_liquidate_return(a[0], a[1], a[2], a[3]);
    case Formula::Power: {
        if (a[4] > 65535) {
            throw std::invalid_argument("power: precision " + a[4].str() + " out of range");
        }
        return formula.power(a[0], a[1], a[2], a[3], a[4].convert_to<unsigned>());
    }
    }
    throw std::invalid_argument("unknown formula");
}

json::object process_call(const BondingFormula& formula, const json::object& call_obj, size_t idx) {
    json::object result;
    if (const json::value* name = call_obj.if_contains("name")) {
        result["name"] = *name;
    } else {
        result["name"] = "call_" + std::to_string(idx);
    }

    try {
        FormulaCall call = FormulaCall::from_json(call_obj);
        result["formula"] = formula_name(call.formula);

        if (auto violation = domain_violation(call)) {
            result["status"] = "skipped";
            result["reason"] = *violation;
            return result;
        }

        OracleReal value = evaluate(formula, call);
        result["status"] = "ok";
        result["value"] = value.str(std::numeric_limits<OracleReal>::digits10);
    } catch (const std::exception& e) {
        result["status"] = "failed";
        result["error"] = e.what();
    }
    return result;
}

void CallTally::record(const json::object& result) {
    const json::string& status = result.at("status").as_string();
    if (status == "ok") {
        ++ok;
    } else if (status == "skipped") {
        ++skipped;
    } else {
        ++failed;
    }
}

} // namespace fixedexp
